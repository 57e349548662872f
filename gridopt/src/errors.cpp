#include "gridopt/errors.hpp"

#include <sstream>

UnknownEntityError::UnknownEntityError(const std::string& kind,
                                       std::vector<index_type> ids)
    : GridError(([&kind, &ids]() {
        std::ostringstream os;
        os << "unknown " << kind << (ids.size() > 1 ? "s" : "") << ":";
        for (const auto id : ids) {
          os << " " << id;
        }
        return os.str();
      })()),
      kind(kind),
      ids(std::move(ids)) {}

NoPathError::NoPathError(index_type source, index_type target)
    : GridError("no path from node " + std::to_string(source) + " to node " +
                std::to_string(target)),
      source(source),
      target(target) {}
