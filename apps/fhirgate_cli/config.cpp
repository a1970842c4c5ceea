#include "config.h"

namespace fhirgate::cli {

bool parse_audit_chain_verify(GlobalConfig& config, const std::string& value) {
  if (value == "off") {
    config.audit_chain_verify = AuditChainVerifyMode::kOff;
    return true;
  }
  if (value == "warn") {
    config.audit_chain_verify = AuditChainVerifyMode::kWarn;
    return true;
  }
  if (value == "fail") {
    config.audit_chain_verify = AuditChainVerifyMode::kFail;
    return true;
  }
  std::cerr << "Invalid --audit-chain-verify: " << value << " (valid: off, warn, fail)\n";
  return false;
}

}  // namespace fhirgate::cli
