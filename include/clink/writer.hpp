#ifndef CLINK_WRITER_HPP
#define CLINK_WRITER_HPP

#include <string>

#include "registry.hpp"
#include "status.hpp"

namespace clink {

// Plain text for terminals. Lists print as "title:" plus indented values, tables as bordered grids.
Output humanWriter(const Status& status);

// One JSON array of element objects on stdout; alert contents go to stderr as a second array.
Output jsonWriter(const Status& status);

// Tables as CSV with a header row. Text passes through verbatim and a list becomes one row.
Output csvWriter(const Status& status);

// Installs "human", "json" and "csv".
void registerDefaultWriters(Registry& registry);

namespace writer {

std::string renderTable(const Table& table);
std::string jsonEscape(const std::string& s);
std::string csvField(const std::string& s);

} // namespace writer

} // namespace clink

#endif // CLINK_WRITER_HPP
