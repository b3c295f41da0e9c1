#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(workspace);
DECLARE_string(output_directory);
DECLARE_string(result_file);

#endif
