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

#include <zrk/utilities/parsers.hpp>
#include <zrk/utilities/xmlutils.hpp>

// we only want to include these here.
#include <rapidxml.hpp>
#include <rapidxml_print.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace rapidxml;
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

namespace ZeroRisk {

XMLDocument::XMLDocument() : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {}

XMLDocument::XMLDocument(const string& fileName) : _doc(new rapidxml::xml_document<char>()), _buffer(NULL) {
    try {
        // the whole file is held in memory, rapidxml parses in place
        std::ifstream t(fileName.c_str());
        QL_REQUIRE(t.is_open(), "Failed to open file " << fileName);
        std::ostringstream contents;
        contents << t.rdbuf();
        QL_REQUIRE(!t.bad(), "Failed to read file " << fileName);
        QL_REQUIRE(!contents.str().empty(), "File " << fileName << " is empty or cannot be read.");
        fromXMLString(contents.str());
    } catch (...) {
        // the destructor does not run for a partially constructed document
        delete[] _buffer;
        delete _doc;
        throw;
    }
}

XMLDocument::~XMLDocument() {
    if (_buffer != NULL)
        delete[] _buffer;
    if (_doc != NULL)
        delete _doc;
}

void XMLDocument::fromXMLString(const string& xmlString) {
    QL_REQUIRE(_buffer == NULL, "XML Document is already loaded");
    Size length = xmlString.size();
    _buffer = new char[length + 1];
    std::memcpy(_buffer, xmlString.c_str(), length);
    _buffer[length] = '\0';
    try {
        _doc->parse<0>(_buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where(pe.where<char>(), std::min<Size>(30, std::strlen(pe.where<char>())));
        QL_FAIL("RapidXML Parse Error : " << pe.what() << ". where=" << where);
    }
}

XMLNode* XMLDocument::getFirstNode(const string& name) const { return _doc->first_node(name == "" ? NULL : name.c_str()); }

void XMLDocument::appendNode(XMLNode* node) { _doc->append_node(node); }

void XMLDocument::toFile(const string& fileName) const {
    std::ofstream ofs(fileName.c_str());
    QL_REQUIRE(ofs.is_open(), "Failed to open file " << fileName << " for writing");
    ofs << *_doc;
    ofs.close();
}

string XMLDocument::toString() const {
    std::ostringstream oss;
    oss << *_doc;
    return oss.str();
}

char* XMLDocument::allocString(const string& str) { return _doc->allocate_string(str.c_str()); }

XMLNode* XMLDocument::allocNode(const string& nodeName) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& nodeValue) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName), allocString(nodeValue));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(node->name() == expectedName,
               "XML Node name " << node->name() << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const string& value) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    XMLNode* node = value.size() == 0 ? doc.allocNode(name) : doc.allocNode(name, value);
    n->append_node(node);
    return node;
}

XMLNode* XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const vector<Real>& values) {
    std::ostringstream oss;
    oss << std::setprecision(16);
    for (Size i = 0; i < values.size(); ++i)
        oss << (i == 0 ? "" : ",") << values[i];
    return addChild(doc, n, name, oss.str());
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XML Parent Node is NULL");
    QL_REQUIRE(child, "XML Child Node is NULL");
    parent->append_node(child);
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    QL_REQUIRE(node, "XMLNode is NULL (was looking for child " << name << ")");
    XMLNode* child = node->first_node(name.c_str());
    if (mandatory) {
        QL_REQUIRE(child, "Error: No XML Child Node " << name << " found.");
    }
    return child ? getNodeValue(child) : defaultValue;
}

vector<Real> XMLUtils::getChildrenValuesAsDoublesCompact(XMLNode* node, const string& name, bool mandatory) {
    string s = getChildValue(node, name, mandatory);
    return parseListOfValues<Real>(s, std::function<Real(const string&)>(&parseReal));
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    const char* p = name.size() == 0 ? NULL : name.c_str();
    for (XMLNode* c = node->first_node(p); c; c = c->next_sibling(p))
        res.push_back(c);
    return res;
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    // handle CDATA nodes
    XMLNode* n = node->first_node();
    if (n && n->type() == node_cdata)
        return n->value();
    // all other cases
    return node->value();
}

} // namespace ZeroRisk
