#pragma once

// cmd_inspect: decode an identifier given as hex or decimal and print it as JSON.
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
