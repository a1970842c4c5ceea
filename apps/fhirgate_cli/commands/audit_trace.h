#pragma once

// cmd_audit_trace: print the events of one trace and the result of verifying its chain.
// Exit codes: 0 chain intact, 2 chain corrupt, 1 usage or storage error.
int cmd_audit_trace(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
