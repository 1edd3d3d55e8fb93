#pragma once

// cmd_eu_basis: list the EU directives and regulations a statute refers to.
// Usage: lexcite_cli eu-basis --db <path> --document <id> [--articles]
//                             [--reference-type <t>]...
int cmd_eu_basis(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_provision_eu_basis: list the EU references of one provision.
// Usage: lexcite_cli provision-eu-basis --db <path> --document <id> --provision-ref <r>
int cmd_provision_eu_basis(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_eu_implementations: list the Austrian statutes referring to an EU document.
// Usage: lexcite_cli eu-implementations <eu-document-id> --db <path>
//                                       [--primary-only] [--in-force-only]
int cmd_eu_implementations(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_search_eu: find EU documents and count their Austrian implementations.
// Usage: lexcite_cli search-eu --db <path> [--query <q>] [--type directive|regulation]
//                              [--community <c>] [--year-from <y>] [--year-to <y>]
//                              [--implemented|--not-implemented] [--limit <n>]
int cmd_search_eu(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_eu_compliance: grade the recorded EU references of a statute or provision.
// Usage: lexcite_cli eu-compliance --db <path> --document <id>
//                                  [--provision-ref <r>] [--eu-document <id>]
int cmd_eu_compliance(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
