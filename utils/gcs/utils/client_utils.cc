/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"

#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload>";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace gcs {

using namespace seastar;
static seastar::logger xml_log("gcs_xml");

std::string parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        xml_log.warn("cannot parse initiate multipart upload response: {}", e.what());
        return "";
    }
    auto root_node = doc->first_node("InitiateMultipartUploadResult");
    if (!root_node) {
        return "";
    }
    auto uploadid_node = root_node->first_node("UploadId");
    return uploadid_node ? uploadid_node->value() : "";
}

unsigned prepare_multipart_upload_parts(const std::vector<std::string>& etags) {
    unsigned ret = multipart_upload_complete_header.size();

    unsigned nr = 1;
    for (auto& etag : etags) {
        if (etag.empty()) {
            // A failed part, the upload has to be aborted
            return 0;
        }
        // format string minus the two "{}" pairs
        ret += multipart_upload_complete_entry.size() - 4 + etag.size() + fmt::formatted_size("{}", nr);
        nr++;
    }
    ret += multipart_upload_complete_trailer.size();
    return ret;
}

future<> dump_multipart_upload_parts(output_stream<char> out, const std::vector<std::string>& etags) {
    std::exception_ptr ex;
    try {
        co_await out.write(multipart_upload_complete_header.data(), multipart_upload_complete_header.size());

        unsigned nr = 1;
        for (auto& etag : etags) {
            if (etag.empty()) {
                throw std::logic_error(fmt::format("part {} has no ETag", nr));
            }
            co_await out.write(fmt::format(fmt::runtime(multipart_upload_complete_entry), nr, etag));
            nr++;
        }
        co_await out.write(multipart_upload_complete_trailer.data(), multipart_upload_complete_trailer.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root,
                                    std::initializer_list<std::string_view> names) {
    if (!root) {
        throw std::invalid_argument("no XML root node");
    }
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw std::runtime_error(fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

std::string parse_xml_error(sstring& body) {
    if (body.empty()) {
        return "";
    }
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
        auto* message = first_node_of(doc.get(), {"Error", "Message"});
        return message->value();
    } catch (const rapidxml::parse_error& e) {
        xml_log.debug("error response is not XML: {}", e.what());
    } catch (const std::runtime_error&) {
        // not an <Error> document
    }
    return "";
}

} // namespace gcs
