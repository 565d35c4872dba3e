#include "clink/writer.hpp"

namespace clink {

void registerDefaultWriters(Registry& registry) {
    registry.registerWriter("human", humanWriter);
    registry.registerWriter("json", jsonWriter);
    registry.registerWriter("csv", csvWriter);
}

} // namespace clink
