#pragma once

#include <expected>
#include <string>


namespace stash {

    // Success, or a message describing what went wrong
    using ErrStr = std::expected<void, std::string>;

}  // namespace stash
