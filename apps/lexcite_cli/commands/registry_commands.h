#pragma once

// cmd_list_sources: print data provenance and registry build metadata.
// Usage: lexcite_cli list-sources --db <path>
int cmd_list_sources(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_about: describe lexcite and the opened dataset.
// Usage: lexcite_cli about --db <path>
int cmd_about(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
