// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "family_reader.hpp"

#include <array>
#include <vector>
#include <string>
#include <fstream>
#include <algorithm>
#include <iterator>
#include <cstddef>
#include <utility>
#include <cctype>

#include <boost/optional.hpp>
#include <boost/tokenizer.hpp>
#include <boost/filesystem/operations.hpp>

#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "utils/string_utils.hpp"

namespace heredity { namespace io {

class MissingFamilyFile : public MissingFileError
{
    std::string do_where() const override { return "read_family"; }
public:
    MissingFamilyFile(boost::filesystem::path file) : MissingFileError {std::move(file), "family"} {}
};

class MalformedFamilyFile : public MalformedFileError
{
    std::string do_where() const override { return "read_family"; }
    std::string do_help() const override
    {
        return "the first line must name the columns name, mother, father and trait, and each trait must be 1, 0 or empty";
    }
public:
    MalformedFamilyFile(boost::filesystem::path file, std::string reason, std::size_t line_number)
    : MalformedFileError {std::move(file), "family CSV"}
    {
        set_reason(std::move(reason));
        set_line_number(line_number);
    }
};

namespace {

enum class Column : std::size_t { name, mother, father, trait };

constexpr std::size_t num_columns {4};

const std::array<std::string, num_columns> column_names {{"name", "mother", "father", "trait"}};

using ColumnIndices = std::array<std::size_t, num_columns>;

struct Line
{
    std::string data;
    std::size_t number;
};

bool read_line(std::istream& is, Line& line)
{
    if (!std::getline(is, line.data)) return false;
    if (!line.data.empty() && line.data.back() == '\r') {
        line.data.pop_back();
    }
    ++line.number;
    return true;
}

bool is_blank(const std::string& line)
{
    return std::all_of(std::cbegin(line), std::cend(line), [] (unsigned char c) { return std::isspace(c); });
}

using FieldSeparator = boost::escaped_list_separator<char>;
using FieldTokenizer = boost::tokenizer<FieldSeparator>;

// Quotes group a field, so a quoted field may contain the separator. There is no escape character.
const FieldSeparator csv_separator {"", ",", "\""};

// An unterminated quote swallows the rest of the line and is caught by the field count check.
std::vector<std::string> parse_fields(const std::string& line)
{
    std::vector<std::string> result {};
    const FieldTokenizer tokens {line, csv_separator};
    for (auto field : tokens) {
        result.push_back(std::move(utils::trim(field)));
    }
    return result;
}

struct Header
{
    ColumnIndices columns;
    std::size_t num_fields;
};

Header parse_header(const Line& line, const boost::filesystem::path& file)
{
    const auto fields = parse_fields(line.data);
    Header result {};
    result.num_fields = fields.size();
    for (std::size_t column {0}; column < num_columns; ++column) {
        const auto field_itr = std::find(std::cbegin(fields), std::cend(fields), column_names[column]);
        if (field_itr == std::cend(fields)) {
            throw MalformedFamilyFile {file, "the header has no '" + column_names[column] + "' column", line.number};
        }
        result.columns[column] = std::distance(std::cbegin(fields), field_itr);
    }
    return result;
}

const std::string& get(const std::vector<std::string>& fields, const Header& header, const Column column)
{
    return fields[header.columns[static_cast<std::size_t>(column)]];
}

boost::optional<PersonName> parse_parent(const std::string& field)
{
    if (field.empty()) return boost::none;
    return field;
}

FamilyRecord parse_record(const Line& line, const Header& header, const boost::filesystem::path& file)
{
    const auto fields = parse_fields(line.data);
    if (fields.size() != header.num_fields) {
        throw MalformedFamilyFile {file, "expected " + std::to_string(header.num_fields) + " fields but found "
                                   + std::to_string(fields.size()), line.number};
    }
    FamilyRecord result {};
    result.name   = get(fields, header, Column::name);
    result.mother = parse_parent(get(fields, header, Column::mother));
    result.father = parse_parent(get(fields, header, Column::father));
    const auto& trait = get(fields, header, Column::trait);
    if (trait == "1") {
        result.trait = true;
    } else if (trait == "0") {
        result.trait = false;
    } else if (!trait.empty()) {
        throw MalformedFamilyFile {file, "the trait '" + trait + "' is not 1, 0 or empty", line.number};
    }
    return result;
}

} // namespace

std::vector<FamilyRecord> read_family_records(const boost::filesystem::path& family_file)
{
    if (!boost::filesystem::exists(family_file)) {
        throw MissingFamilyFile {family_file};
    }
    std::ifstream family_stream {family_file.string()};
    Line line {{}, 0};
    boost::optional<Header> header {};
    std::vector<FamilyRecord> result {};
    while (read_line(family_stream, line)) {
        if (is_blank(line.data)) continue;
        if (header) {
            result.push_back(parse_record(line, *header, family_file));
        } else {
            header = parse_header(line, family_file);
        }
    }
    if (!header) {
        throw MalformedFamilyFile {family_file, "the file has no header", line.number};
    }
    return result;
}

Family read_family(const boost::filesystem::path& family_file)
{
    return make_family(read_family_records(family_file));
}

} // namespace io
} // namespace heredity
