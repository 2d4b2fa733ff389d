#ifndef LANSHARE_HTTP_JSON_VIEWS_HPP
#define LANSHARE_HTTP_JSON_VIEWS_HPP

#include "engine/events.hpp"
#include "engine/types.hpp"
#include "store/pending_share_store.hpp"
#include <map>
#include <nlohmann/json.hpp>

namespace lanshare {

nlohmann::json status_to_json(const RoomStatus &status);
nlohmann::json send_result_to_json(const SendResult &result);
nlohmann::json pending_share_to_json(const PendingShare &share);
nlohmann::json pending_counts_to_json(const PendingShareCounts &counts);

nlohmann::json event_to_json(const ConnectionStateChanged &e);
nlohmann::json event_to_json(const PeerDisconnected &e);
nlohmann::json event_to_json(const ArticleReceived &e);
nlohmann::json event_to_json(const ArticlesReceivedBatch &e);
nlohmann::json event_to_json(const EchoResponse &e);
nlohmann::json event_to_json(const PendingSharesChanged &e);

} // namespace lanshare

#endif
