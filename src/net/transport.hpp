#ifndef LANSHARE_NET_TRANSPORT_HPP
#define LANSHARE_NET_TRANSPORT_HPP

#include "engine/types.hpp"
#include "peer_link.hpp"
#include "strand.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lanshare {

class ITransportListener {
public:
  virtual ~ITransportListener() = default;
  // Handshake finished; the peer is reachable by id from now on.
  virtual void on_peer_connected(const PeerId &peer, const std::string &name,
                                 const std::string &address) = 0;
  virtual void on_peer_message(const PeerId &peer, const Message &msg) = 0;
  // A connected link closed on its own (EOF, reset, oversize frame).
  virtual void on_peer_lost(const PeerId &peer,
                            const boost::system::error_code &ec) = 0;
  // An outbound dial never reached the connected state.
  virtual void on_dial_failed(const PeerId &expected) = 0;
};

// TCP side of a room: the listening socket, dials to discovered peers and
// the handshake that turns a socket into a connected peer.
class Transport : public ILinkHandler {
public:
  Transport(Strand strand, const RoomOptions &options,
            ITransportListener &listener);
  ~Transport() override;

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  void set_identity(const PeerId &local_id, const std::string &display_name);

  // Binds the first free port of the configured range and starts accepting.
  boost::system::error_code listen();
  uint16_t port() const { return port_; }

  void dial(const PeerId &expected, const std::string &address,
            uint16_t port);

  bool send(const PeerId &peer, const Message &msg);
  bool send_final(const PeerId &peer, const Message &msg);
  bool is_connected(const PeerId &peer) const;
  std::vector<PeerId> connected_peers() const;

  // Closes the peer's link without reporting it as lost.
  void drop(const PeerId &peer);
  // Closes the listener and every link. Idempotent.
  void shutdown();

  size_t open_sockets() const;
  size_t armed_timers() const;
  size_t handshaking() const { return pending_.size(); }

  void on_link_message(const std::shared_ptr<PeerLink> &link,
                       const Message &msg) override;
  void on_link_closed(const std::shared_ptr<PeerLink> &link,
                      const boost::system::error_code &ec) override;

private:
  Strand strand_;
  RoomOptions options_;
  ITransportListener &listener_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t port_{0};
  uint64_t generation_{0};

  PeerId local_id_;
  std::string local_name_;

  // Links still in Connecting or Handshaking.
  std::set<std::shared_ptr<PeerLink>> pending_;
  std::map<PeerId, std::shared_ptr<PeerLink>> links_;

  void do_accept();
  void promote(const std::shared_ptr<PeerLink> &link, const PeerId &peer,
               const std::string &name);
};

} // namespace lanshare

#endif
