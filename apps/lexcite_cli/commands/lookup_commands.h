#pragma once

// cmd_get_provision: print one provision, or every provision of a document.
// Usage: lexcite_cli get-provision --db <path> --document <id>
//                                  [--section <s>] [--provision-ref <r>]
int cmd_get_provision(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_check_currency: report whether a statute (and optionally one of its
// provisions) is current.
// Usage: lexcite_cli check-currency --db <path> --document <id> [--provision-ref <r>]
//                                   [--as-of-date <YYYY-MM-DD>]
// Exits 1 when the document cannot be found.
int cmd_check_currency(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_search: full-text search over provision content and titles.
// Usage: lexcite_cli search <query> --db <path> [--document <id>]
//                           [--status in_force|amended|repealed] [--limit <n>]
int cmd_search(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
