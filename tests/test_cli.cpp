#include "test_framework.hpp"

#include "almanac/cli/commands.hpp"

#include <chrono>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace {

struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { almanac::tests::require(pipe(fds) == 0, "pipe failed"); }
  ~Pipe() {
    for (const int fd : fds) {
      if (fd >= 0) {
        close(fd);
      }
    }
  }
  void close_writer() {
    close(fds[1]);
    fds[1] = -1;
  }
};

} // namespace

void register_cli_tests(std::vector<almanac::tests::TestCase> &tests) {
  using almanac::tests::require;

  tests.push_back({"cli_wait_returns_on_newline", [] {
                     Pipe input;
                     const std::string line = "\n";
                     require(write(input.fds[1], line.data(), line.size()) == 1, "write failed");
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                     bool timed_out = false;
                     almanac::cli::wait_for_stop(input.fds[0], [&] {
                       timed_out = std::chrono::steady_clock::now() > deadline;
                       return timed_out;
                     });
                     require(!timed_out, "newline should end the wait");
                   }});

  tests.push_back({"cli_wait_survives_end_of_input", [] {
                     Pipe input;
                     input.close_writer();
                     int checks = 0;
                     almanac::cli::wait_for_stop(input.fds[0], [&checks] { return ++checks > 5; });
                     require(checks > 5, "end of input must not end the wait");
                   }});

  tests.push_back({"cli_wait_survives_dev_null", [] {
                     const int null_fd = open("/dev/null", O_RDONLY);
                     require(null_fd >= 0, "open /dev/null failed");
                     int checks = 0;
                     almanac::cli::wait_for_stop(null_fd, [&checks] { return ++checks > 3; });
                     close(null_fd);
                     require(checks > 3, "/dev/null stdin must not end the wait");
                   }});
}
