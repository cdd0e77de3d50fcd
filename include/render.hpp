/**
 * @file render.hpp
 * @brief Output formats for the discovered repository tree.
 *
 * Provides the plain text printer and the JSON/YAML serializers together with
 * conversions between format names and the OutputFormat enum.
 */
#ifndef REMOTESCAN_RENDER_HPP
#define REMOTESCAN_RENDER_HPP

#include "result_node.hpp"

#include <cstddef>
#include <iosfwd>
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>

namespace rscan {

/// Supported report formats.
enum class OutputFormat {
  Plain, ///< Indented human readable tree
  Yaml,  ///< YAML document
  Json   ///< Pretty printed JSON document
};

/// Serializer could not encode the tree.
class RenderError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Convert an output format to its lowercase name.
 * @param format Output format.
 * @return `plain`, `yaml` or `json`.
 */
std::string to_string(OutputFormat format);

/**
 * @brief Parse an output format name.
 * @param value Format name (case-insensitive).
 * @return Parsed OutputFormat value.
 * @throws std::invalid_argument When the name is not recognised.
 */
OutputFormat output_format_from_string(const std::string &value);

/**
 * @brief Build the JSON representation of a tree.
 *
 * Empty `remotes` and `children` members are omitted.
 */
nlohmann::json to_json(const ResultNode &node);

/**
 * @brief Serialize a tree as a YAML block document.
 *
 * Empty `remotes` and `children` members are omitted.
 *
 * @throws RenderError When the emitter rejects the document.
 */
std::string to_yaml(const ResultNode &node);

/**
 * @brief Print a tree as indented plain text.
 * @param node Tree root.
 * @param out Destination stream.
 * @param indent Indentation level of @p node, two spaces per level.
 */
void render_plain(const ResultNode &node, std::ostream &out,
                  std::size_t indent = 0);

/**
 * @brief Write a tree in the requested format followed by a newline.
 * @throws RenderError When serialization fails.
 */
void render(const ResultNode &node, OutputFormat format, std::ostream &out);

} // namespace rscan

#endif // REMOTESCAN_RENDER_HPP
