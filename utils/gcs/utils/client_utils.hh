/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include <string>
#include <string_view>
#include <vector>

#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

namespace gcs {

// Empty when the response cannot be parsed, the caller decides how to fail
std::string parse_multipart_upload_id(seastar::sstring& body);
// Size of the CompleteMultipartUpload body, 0 when some part has no ETag
unsigned prepare_multipart_upload_parts(const std::vector<std::string>& etags);
seastar::future<> dump_multipart_upload_parts(seastar::output_stream<char> out, const std::vector<std::string>& etags);
rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);
// Message of an XML <Error> body, empty if there is none
std::string parse_xml_error(seastar::sstring& body);

} // namespace gcs
