#pragma once

// cmd_parse: print the structured form of a citation.
// Usage: lexcite_cli parse <citation>
int cmd_parse(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_format: parse a citation and print it in canonical form.
// Usage: lexcite_cli format <citation> [--style full|short|pinpoint]
int cmd_format(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_candidates: print every stored key a provision reference may match.
// Usage: lexcite_cli candidates <ref>
int cmd_candidates(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_validate: check a citation against a registry database.
// Usage: lexcite_cli validate <citation> --db <path> [--id-prefix <prefix>]
// Exits 0 whenever validation ran; the verdict is in the JSON output.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
