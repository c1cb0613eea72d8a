#include "server/connection.hpp"

namespace bridge::server {

connection::~connection() {}

}  // namespace bridge::server
