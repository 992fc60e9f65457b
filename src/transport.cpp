#include "sitewarden/transport.hpp"

#include "sitewarden/errors.hpp"

namespace SiteWarden {

void ensure_ok(const Response& response) {
    if (response.status != STATUS_OK) {
        throw RemoteCommunicationError(response.status, response.reason);
    }
}

} // namespace SiteWarden
