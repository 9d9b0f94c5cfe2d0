/**
 * @file document_loader.cpp
 */
#include "xdslc/document/document_loader.hpp"
#include "xdslc/common/conversion_exceptions.hpp"

#include <tinyxml2.h>

namespace xdslc
{

namespace
{

XmlElement copy_element(const tinyxml2::XMLElement* source)
{
    XmlElement element;
    element.name = source->Name();
    element.line = source->GetLineNum();

    for (const tinyxml2::XMLAttribute* attr = source->FirstAttribute();
         attr != nullptr;
         attr = attr->Next())
    {
        element.attributes.push_back(XmlAttribute{attr->Name(), attr->Value()});
    }

    for (const tinyxml2::XMLNode* child = source->FirstChild();
         child != nullptr;
         child = child->NextSibling())
    {
        if (const tinyxml2::XMLElement* child_element = child->ToElement())
        {
            element.children.push_back(copy_element(child_element));
        }
        else if (const tinyxml2::XMLText* child_text = child->ToText())
        {
            element.text += child_text->Value();
        }
    }

    return element;
}

} // namespace

XmlElement load_document(std::string_view text)
{
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError status = doc.Parse(text.data(), text.size());
    if (status != tinyxml2::XML_SUCCESS)
    {
        const char* detail = doc.ErrorStr();
        throw ConversionError(
            ConversionErrorCode::MalformedDocument,
            "Malformed document at line " + std::to_string(doc.ErrorLineNum()) + ": " +
                (detail != nullptr ? detail : "unknown parse error"));
    }

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr)
    {
        throw ConversionError(
            ConversionErrorCode::MalformedDocument,
            "Malformed document: no root element");
    }

    return copy_element(root);
}

} // namespace xdslc
