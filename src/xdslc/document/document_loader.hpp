/**
 * @file document_loader.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/document/attributed_tree.hpp"

namespace xdslc
{

/**
 * @brief Parse raw XDSL text into a generic attributed tree.
 *
 * @details
 * Only well-formedness is checked; element names and attribute values are
 * not interpreted.
 *
 * @param text The complete document.
 * @return The root element.
 * @throw ConversionError with `MalformedDocument` if the text is not
 *        well-formed markup or has no root element. The message carries the
 *        parser's line number and description.
 */
XmlElement load_document(std::string_view text);

} // namespace xdslc
