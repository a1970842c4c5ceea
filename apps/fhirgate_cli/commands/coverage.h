#pragma once

// cmd_coverage: report which schema paths the rules cover, which a suggestion
// would cover, and which nothing covers.
int cmd_coverage(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
