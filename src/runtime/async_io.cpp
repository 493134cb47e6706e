#include "ferry/runtime/async_io.hpp"

#include <string>

namespace ferry::runtime
{

bool is_peer_closed(const boost::system::error_code& ec)
{
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
}

Error asio_error(const boost::system::error_code& ec, std::string_view what)
{
    std::string message{what};
    message += ": ";
    message += ec.message();
    if (is_peer_closed(ec)) {
        return make_error(ErrorCode::TransportEOF, std::move(message));
    }
    return make_error(ErrorCode::TransportError, std::move(message),
                      GenericError{std::string(ec.category().name()) + ": " + ec.message()});
}

}  // namespace ferry::runtime
