#pragma once

// cmd_save_rules: governance-gated replacement of a project's stored rule set.
// Exit codes: 0 saved, 2 refused because a rule is blocked, 1 usage or store error.
int cmd_save_rules(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
