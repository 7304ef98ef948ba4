#pragma once

// cmd_generate: print --count identifiers from a generator built from the flags.
// cmd_bench: generate --count identifiers as fast as possible and report duplicates.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_bench(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
