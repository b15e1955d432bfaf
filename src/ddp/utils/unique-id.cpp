#include "unique-id.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace ddp {

std::string unique_id() {
  // random_generator seeds itself from the os entropy source, and is not threadsafe
  static thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace ddp
