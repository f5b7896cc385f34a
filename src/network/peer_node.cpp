#include "network/peer_node.hpp"
#include "network/interface_selection.hpp"

namespace lanpeer::network {

PeerNode::PeerNode(Config config,
                   std::unique_ptr<DiscoveryBackend> backend,
                   QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , backend_(std::move(backend))
    , queue_(MessageQueue::DEFAULT_CAPACITY)
    , transport_(queue_)
{
    connect(&group_, &TaskGroup::failed, this, &PeerNode::failed);
}

PeerNode::~PeerNode() {
    stop();
}

Result<QHostAddress, Error> PeerNode::bindAddress() const {
    if (config_.bind_address) {
        return Result<QHostAddress, Error>::ok(*config_.bind_address);
    }
    return select_bind_address(local_interfaces(), config_.subnet);
}

Result<void, Error> PeerNode::start() {
    if (started_) {
        return Result<void, Error>::err(Error{"peer node already started", ErrorCode::InvalidArgument});
    }
    started_ = true;

    auto address = bindAddress();
    if (address.is_err()) {
        return Result<void, Error>::err(address.unwrap_err());
    }

    auto port = transport_.bind(address.unwrap(), config_.port);
    if (port.is_err()) {
        return Result<void, Error>::err(port.unwrap_err());
    }

    discovery_ = std::make_unique<DiscoveryTask>(config_, port.unwrap(), queue_, std::move(backend_));

    group_.add(&transport_);
    group_.add(discovery_.get());
    group_.start();

    if (group_.error()) {
        return Result<void, Error>::err(*group_.error());
    }
    return Result<void, Error>::ok();
}

void PeerNode::stop() {
    group_.cancel();
}

} // namespace lanpeer::network
