#include "manager/result_writer.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace manager {

namespace {
static const constexpr char* kStdoutHeader = "--- stdout ---";
static const constexpr char* kStderrHeader = "--- stderr ---";
}  // namespace

std::string FormatResult(const proto::ExecutionResult& result) {
  std::string record =
      absl::StrCat("exit_code: ", result.exit_code(), "\n", kStdoutHeader,
                   "\n", result.stdout_data(), "\n");
  if (!result.stderr_data().empty()) {
    absl::StrAppend(&record, kStderrHeader, "\n", result.stderr_data(), "\n");
  }
  return record;
}

void WriteResult(const proto::ExecutionResult& result,
                 const std::string& path) {
  util::File::Write(path, FormatResult(result));
  LOG(INFO) << "Result written to " << path;
}

void PrintResult(const proto::ExecutionResult& result, std::ostream& out,
                 std::ostream& err) {
  if (!result.stdout_data().empty()) {
    out << kStdoutHeader << "\n" << result.stdout_data() << std::endl;
  }
  if (!result.stderr_data().empty()) {
    err << kStderrHeader << "\n" << result.stderr_data() << std::endl;
  }
}

}  // namespace manager
