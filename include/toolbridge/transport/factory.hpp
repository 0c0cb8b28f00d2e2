#pragma once
#include "transport.hpp"
#include "../config.hpp"
#include <memory>

namespace toolbridge {

/// Build the (unopened) transport a descriptor asks for.
[[nodiscard]] std::unique_ptr<ITransport> make_transport(const ServerDescriptor& descriptor);

} // namespace toolbridge
