#include "peaktrade/var_suite/suite_app.h"

#include <kj/io.h>
#include <kj/vector.h>
#include <unistd.h>

int main(int argc, char** argv) {
  kj::FdOutputStream out(STDOUT_FILENO);
  kj::FdOutputStream err(STDERR_FILENO);

  kj::Vector<kj::StringPtr> args(static_cast<size_t>(argc > 0 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.add(argv[i] ? kj::StringPtr(argv[i]) : kj::StringPtr(""));
  }

  return peaktrade::var_suite::run_cli(args.asPtr(), out, err);
}
