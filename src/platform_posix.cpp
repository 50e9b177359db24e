#include "platform.h"

#include <cstdio>

#include <unistd.h>

namespace cascade::platform {

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace cascade::platform
