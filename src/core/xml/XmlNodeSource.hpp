#pragma once
#include <string>
#include <vector>

#include "core/xml/NodeSource.hpp"
#include "core/xml/XmlDocument.hpp"

namespace premis {

// Reads the top-level <object>/<event>/<agent>/<rights> children of a
// <premis:premis> root. Document order within a kind is preserved.
class XmlNodeSource : public NodeSource {
public:
  explicit XmlNodeSource(XmlDocument doc);

  static XmlNodeSource fromFile(const std::string& path);
  static XmlNodeSource fromString(const std::string& xml);

  std::vector<Event> findEvents() override;
  std::vector<Agent> findAgents() override;
  std::vector<Rights> findRights() override;
  std::vector<Object> findObjects() override;

private:
  template <typename Node, typename Decode>
  std::vector<Node> collect(const char* name, Decode decode) const;

  XmlDocument doc_;
};

} // namespace premis
