#pragma once

namespace cascade::platform {

bool is_tty();

}  // namespace cascade::platform
