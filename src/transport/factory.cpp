#include "toolbridge/transport/factory.hpp"
#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/transport/socket_transport.hpp"
#include "toolbridge/transport/http_transport.hpp"

namespace toolbridge {

std::unique_ptr<ITransport> make_transport(const ServerDescriptor& descriptor) {
    switch (descriptor.kind) {
    case TransportKind::Process: {
        ProcessTransport::Options opts;
        opts.command = descriptor.command;
        opts.args = descriptor.args;
        opts.env = descriptor.env;
        opts.working_dir = descriptor.working_dir;
        opts.framing = descriptor.framing;
        return std::make_unique<ProcessTransport>(std::move(opts));
    }
    case TransportKind::Network: {
        SocketTransport::Options opts;
        opts.host = descriptor.host;
        opts.port = descriptor.port;
        opts.framing = descriptor.framing;
        opts.connect_timeout = descriptor.connect_timeout;
        return std::make_unique<SocketTransport>(std::move(opts));
    }
    case TransportKind::Http: {
        HttpTransport::Options opts;
        opts.url = descriptor.url;
        opts.headers = descriptor.headers;
        opts.connect_timeout = descriptor.connect_timeout;
        return std::make_unique<HttpTransport>(std::move(opts));
    }
    }
    return nullptr;
}

} // namespace toolbridge
