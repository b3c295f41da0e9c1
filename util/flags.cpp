#include "util/flags.hpp"

DEFINE_string(workspace, "/workspace",
              "Directory that contains the snippet and receives the result");
DEFINE_string(output_directory, "output",
              "Subdirectory of the workspace where the result is written");
DEFINE_string(result_file, "result.txt", "Name of the result file");
