/**
 * @file attributed_tree.hpp
 * @brief Generic element tree produced by the document loader.
 */
#pragma once
#include "xdslc/common/common.hpp"

namespace xdslc
{

/**
 * @brief One `name="value"` pair, in document order.
 */
struct XmlAttribute
{
    std::string name;
    std::string value;
};

/**
 * @brief A markup element with its attributes, text and child elements.
 *
 * @details
 * The tree carries no domain semantics. `text` is the concatenation of the
 * element's direct text content; text belonging to child elements is kept on
 * the children.
 */
struct XmlElement
{
    std::string name;
    std::vector<XmlAttribute> attributes;
    std::string text;
    std::vector<XmlElement> children;

    /// Line of the opening tag in the source document.
    int line{0};

    /**
     * @brief Look up an attribute value.
     * @return Pointer to the value, or nullptr if the attribute is absent.
     */
    const std::string* attribute(std::string_view attr_name) const
    {
        for (const auto& attr : attributes)
        {
            if (attr.name == attr_name)
            {
                return &attr.value;
            }
        }
        return nullptr;
    }

    bool has_attribute(std::string_view attr_name) const
    {
        return attribute(attr_name) != nullptr;
    }

    /**
     * @brief Get the first child element with the given name.
     * @return Pointer to the child, or nullptr if there is none.
     */
    const XmlElement* first_child(std::string_view child_name) const
    {
        for (const auto& child : children)
        {
            if (child.name == child_name)
            {
                return &child;
            }
        }
        return nullptr;
    }

    /**
     * @brief Get all child elements with the given name, in document order.
     */
    std::vector<const XmlElement*> children_named(std::string_view child_name) const
    {
        std::vector<const XmlElement*> result;
        for (const auto& child : children)
        {
            if (child.name == child_name)
            {
                result.push_back(&child);
            }
        }
        return result;
    }
};

} // namespace xdslc
