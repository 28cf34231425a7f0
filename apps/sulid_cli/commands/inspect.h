#pragma once

// cmd_decode:    print the fields of an encoded id (`sulid_cli decode <id>`)
// cmd_increment: print the successor of an encoded id (`sulid_cli increment <id>`)
// cmd_nil:       print the nil id
// cmd_config:    print the library's build switches
namespace sulid::cli {

int cmd_decode(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_increment(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_nil();
int cmd_config();

}  // namespace sulid::cli
