#pragma once

// cmd_clean: strip registry metadata from provision text and print the result
// as plain text.
// Usage: lexcite_cli clean [--file <path>]   (reads stdin without --file)
int cmd_clean(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_fts: print the primary and fallback FTS5 expressions for a query.
// Usage: lexcite_cli fts <query>
int cmd_fts(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
