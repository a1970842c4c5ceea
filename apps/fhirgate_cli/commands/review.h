#pragma once

// cmd_review: run the governance review over a candidate rule set without saving it.
// Exit codes: 0 no rule blocked, 2 at least one rule blocked, 1 usage or input error.
int cmd_review(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
