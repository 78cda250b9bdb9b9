#pragma once
#include "gitwire/capabilities.hpp"
#include "gitwire/config.hpp"
#include "gitwire/connection.hpp"
#include "gitwire/error.hpp"
#include "gitwire/negotiation.hpp"
#include "gitwire/object_source.hpp"
#include "gitwire/pack.hpp"
#include "gitwire/request.hpp"
#include "gitwire/sideband.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace gitwire {

struct UploadPackOptions {
  ServerConfig config = default_server_config();
  ProtocolVersion version = ProtocolVersion::V0; // what the client asked for
  bool stateless_rpc = false;  // one request, one response (smart HTTP)
  bool advertise_refs = false; // only write the advertisement
  bool http_preamble = false;  // "# service=git-upload-pack" first
  std::stop_token stop;
};

/**
 * Server side of one git-upload-pack exchange over a Connection.
 *
 * v0/v1: ref advertisement, wants, optional shallow-info, have rounds
 * answered with ACK/NAK, then the pack through the negotiated side-band.
 * v2: capability advertisement, then ls-refs and fetch commands until the
 * client closes the stream.
 *
 * The object source is only read. One UploadPack serves one client; use a
 * fresh instance per connection or HTTP request.
 */
class UploadPack {
public:
  UploadPack(const ObjectSource &src, UploadPackOptions opts);

  [[nodiscard]] auto v1_capabilities() const -> CapabilitySet;
  [[nodiscard]] auto v2_capabilities() const -> CapabilitySet;

  // Everything the server says before the client's first request.
  [[nodiscard]] auto advertisement() const -> std::vector<std::uint8_t>;

  /**
   * Run the exchange to its end. Request errors are sent to the client
   * (ERR packet, or side-band channel 3 once the pack has started) and
   * returned; transport failures come back as ErrorKind::Io.
   */
  Status serve(Connection &conn);

  // Stateless convenience: feed one request body, collect the response.
  Result<std::vector<std::uint8_t>> handle_request(std::span<const std::uint8_t> body);

  // Statistics of the last pack sent, if any.
  [[nodiscard]] auto last_pack() const -> const std::optional<pack::PackStats> & {
    return last_pack_;
  }

private:
  struct PackRequest {
    sideband::Mode mode = sideband::Mode::None;
    bool progress = true;
    bool ofs_delta = false;
    bool thin_pack = false;
    bool include_tag = false;
  };

  Status serve_v1(Connection &conn, PacketReader &reader);
  Status serve_v2(Connection &conn, PacketReader &reader);
  Status fetch_v2(Connection &conn, const std::vector<std::string> &args);
  Status ls_refs_v2(Connection &conn, const std::vector<std::string> &args);

  // Checks shared by v1 and v2 requests, then process_wants.
  Status start_session(NegotiationSession &session, const FetchRequest &req);
  Result<ShallowResult> apply_shallow(NegotiationSession &session, const FetchRequest &req);
  [[nodiscard]] bool deepening(const FetchRequest &req) const;

  Status send_pack(Connection &conn, const NegotiationSession &session,
                   std::vector<std::string> objects, const PackRequest &how);
  std::vector<pack::PackableObject> client_bases(const NegotiationSession &session,
                                                 const std::vector<pack::PackableObject> &objects) const;

  const ObjectSource &src_;
  UploadPackOptions opts_;
  std::optional<pack::PackStats> last_pack_;
};

} // namespace gitwire
