#pragma once

// cmd_validate: validate one record against inline rules or a project's stored rules.
// Exit codes: 0 compliant, 2 non-compliant, 1 usage or configuration error.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
