/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file zrk/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <string>
#include <vector>

// forward declarations of the rapidxml classes, the header itself is only included in the implementation
namespace rapidxml {
template <class Ch> class xml_node;
template <class Ch> class xml_document;
} // namespace rapidxml

namespace ZeroRisk {

typedef rapidxml::xml_node<char> XMLNode;

//! Small XML Document wrapper class.
/*! \ingroup utilities */
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const std::string& filename);
    //! destructor
    ~XMLDocument();

    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    //! load a document from a hard-coded string
    void fromXMLString(const std::string& xmlString);

    XMLNode* getFirstNode(const std::string& name) const;
    void appendNode(XMLNode*);

    //! save the XML Document to the given file.
    void toFile(const std::string& filename) const;

    std::string toString() const;

    char* allocString(const std::string& str);
    XMLNode* allocNode(const std::string& nodeName);
    XMLNode* allocNode(const std::string& nodeName, const std::string& nodeValue);

private:
    rapidxml::xml_document<char>* _doc;
    char* _buffer;
};

//! Base class for all serializable classes
/*! \ingroup utilities */
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;
    virtual XMLNode* toXML(XMLDocument& doc) const = 0;

    void fromFile(const std::string& filename);
    void toFile(const std::string& filename) const;

    //! Parse from XML string
    void fromXMLString(const std::string& xml);
    //! Parse from XML string
    std::string toXMLString() const;
};

//! XML Utilities Class
/*! \ingroup utilities */
class XMLUtils {
public:
    static void checkNode(XMLNode* n, const std::string& expectedName);

    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const std::string& value);
    //! Adds the values as one comma separated child
    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const std::string& name,
                             const std::vector<QuantLib::Real>& values);

    static void appendNode(XMLNode* parent, XMLNode* child);

    /*! Returns the value of the child node \c name. If the child is missing, this throws if \c mandatory is
        \c true and returns \c defaultValue otherwise.
    */
    static std::string getChildValue(XMLNode* node, const std::string& name, bool mandatory = false,
                                     const std::string& defaultValue = std::string());
    //! Reads a comma separated list of doubles held by a single child node
    static std::vector<QuantLib::Real> getChildrenValuesAsDoublesCompact(XMLNode* node, const std::string& name,
                                                                         bool mandatory = false);

    static std::vector<XMLNode*> getChildrenNodes(XMLNode* node, const std::string& name);

    static std::string getNodeValue(XMLNode* node);
};

} // namespace ZeroRisk
