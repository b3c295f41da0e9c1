#ifndef MANAGER_RESULT_WRITER_HPP
#define MANAGER_RESULT_WRITER_HPP

#include <ostream>
#include <string>

#include "proto/execution.pb.h"

namespace manager {

// Renders the plain-text result record:
//   exit_code: <code>
//   --- stdout ---
//   <stdout>
//   --- stderr ---   (only if stderr is not empty)
//   <stderr>
std::string FormatResult(const proto::ExecutionResult& result);

// Replaces the file at path with the record of result, creating the missing
// directories. Throws std::system_error on failure.
void WriteResult(const proto::ExecutionResult& result, const std::string& path);

// Echoes the non-empty streams of result, stdout to out and stderr to err.
void PrintResult(const proto::ExecutionResult& result, std::ostream& out,
                 std::ostream& err);

}  // namespace manager

#endif
