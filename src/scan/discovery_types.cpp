/*
 * CrowdScan - Discovery Types
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/scan/discovery_types.h"

namespace crowdscan {
namespace scan {

const char* scan_failure_name(uint8_t code) {
  switch (code) {
    case SCAN_FAILED_ALREADY_STARTED:           return "ALREADY_STARTED";
    case SCAN_FAILED_REGISTRATION_FAILED:       return "REGISTRATION_FAILED";
    case SCAN_FAILED_INTERNAL_ERROR:            return "INTERNAL_ERROR";
    case SCAN_FAILED_FEATURE_UNSUPPORTED:       return "FEATURE_UNSUPPORTED";
    case SCAN_FAILED_OUT_OF_HARDWARE_RESOURCES: return "OUT_OF_HARDWARE_RESOURCES";
    case SCAN_FAILED_SCANNING_TOO_FREQUENTLY:   return "SCANNING_TOO_FREQUENTLY";
    default:                                    return "UNKNOWN";
  }
}

ScanFailureClass classify_scan_failure(uint8_t code) {
  switch (code) {
    case SCAN_FAILED_ALREADY_STARTED:
      return FAILURE_IGNORED;
    case SCAN_FAILED_INTERNAL_ERROR:
    case SCAN_FAILED_SCANNING_TOO_FREQUENTLY:
      return FAILURE_RECOVERABLE;
    case SCAN_FAILED_REGISTRATION_FAILED:
    case SCAN_FAILED_FEATURE_UNSUPPORTED:
    case SCAN_FAILED_OUT_OF_HARDWARE_RESOURCES:
      return FAILURE_FATAL;
    default:
      return FAILURE_UNKNOWN;
  }
}

} // namespace scan
} // namespace crowdscan
