#include <treediff/diff/encoding.h>

#include <cmath>
#include <type_traits>

#include <treediff/encodings/json.h>

namespace treediff {

// WRITING

static dynamic
to_dynamic(date_marker_list const& dates)
{
    dynamic_array array;
    array.reserve(dates.size());
    for (auto const& path : dates)
        array.push_back(to_dynamic(path));
    return array;
}

static dynamic
to_dynamic(array_item const& item)
{
    if (auto const* insertion = std::get_if<array_insertion>(&item))
        return dynamic_map{{"kind", "N"}, {"rhs", insertion->rhs}};
    return dynamic_map{
        {"kind", "D"}, {"lhs", std::get<array_deletion>(item).lhs}};
}

dynamic
to_dynamic(value_diff_item const& item)
{
    dynamic_map record;
    record["kind"] = string(1, get_kind_code(get_kind(item)));
    if (item.path)
        record["path"] = to_dynamic(*item.path);
    std::visit(
        [&](auto const& change) {
            using change_type = std::decay_t<decltype(change)>;
            if constexpr (std::is_same_v<change_type, value_edit>)
            {
                record["lhs"] = change.lhs;
                record["rhs"] = change.rhs;
            }
            else if constexpr (std::is_same_v<change_type, value_addition>)
            {
                record["rhs"] = change.rhs;
            }
            else if constexpr (std::is_same_v<change_type, value_removal>)
            {
                record["lhs"] = change.lhs;
            }
            else
            {
                record["index"] = change.index;
                record["item"] = to_dynamic(change.item);
            }
        },
        item.change);
    if (item.dates)
        record["$dates"] = to_dynamic(*item.dates);
    return record;
}

dynamic
value_diff_to_dynamic(value_diff const& diff)
{
    dynamic_array records;
    records.reserve(diff.size());
    for (auto const& item : diff)
        records.push_back(to_dynamic(item));
    return records;
}

string
value_diff_to_json(optional<value_diff> const& diff, int indent)
{
    if (!diff)
        return value_to_json(nil, indent);
    return value_to_json(value_diff_to_dynamic(*diff), indent);
}

// READING

static void
throw_invalid_change(string const& message)
{
    TREEDIFF_THROW(invalid_change() << diff_error_message_info(message));
}

static dynamic_map const&
read_map(dynamic const& v, char const* what)
{
    if (v.type() != value_type::MAP)
    {
        TREEDIFF_THROW(
            invalid_change()
            << diff_error_message_info(string(what) + " must be a map")
            << found_value_type_info(v.type()));
    }
    return cast<dynamic_map>(v);
}

static dynamic_array const&
read_array(dynamic const& v, char const* what)
{
    if (v.type() != value_type::ARRAY)
    {
        TREEDIFF_THROW(
            invalid_change()
            << diff_error_message_info(string(what) + " must be an array")
            << found_value_type_info(v.type()));
    }
    return cast<dynamic_array>(v);
}

static optional<size_t>
read_index(dynamic const& v)
{
    if (v.type() != value_type::NUMBER)
        return none;
    double d = cast<double>(v);
    if (!std::isfinite(d) || d < 0 || d != std::floor(d)
        || d > max_serialized_index)
    {
        return none;
    }
    return static_cast<size_t>(d);
}

static path_element
read_path_element(dynamic const& v)
{
    if (v.type() == value_type::STRING)
        return cast<string>(v);
    auto index = read_index(v);
    if (!index)
    {
        TREEDIFF_THROW(
            invalid_change()
            << diff_error_message_info(
                   "path elements must be strings or indices")
            << path_element_info(v));
    }
    return *index;
}

static property_path
read_path(dynamic const& v)
{
    property_path path;
    auto const& array = read_array(v, "path");
    path.reserve(array.size());
    for (auto const& e : array)
        path.push_back(read_path_element(e));
    return path;
}

static dynamic const&
read_value_field(dynamic_map const& record, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, record, field))
    {
        TREEDIFF_THROW(
            invalid_change()
            << diff_error_message_info("missing field") << field_name_info(field));
    }
    return *v;
}

static string
read_kind(dynamic_map const& record)
{
    dynamic const* kind;
    if (!get_field(&kind, record, "kind")
        || kind->type() != value_type::STRING)
    {
        throw_invalid_change("record must have a string kind");
    }
    return cast<string>(*kind);
}

static array_item
read_array_item(dynamic const& v)
{
    auto const& item = read_map(v, "array item");
    auto kind = read_kind(item);
    if (kind == "N")
        return array_insertion{read_value_field(item, "rhs")};
    if (kind == "D")
        return array_deletion{read_value_field(item, "lhs")};
    TREEDIFF_THROW(
        invalid_change()
        << diff_error_message_info("invalid array item kind: " + kind));
}

static optional<date_marker_list>
read_dates(dynamic const& v)
{
    date_marker_list dates;
    for (auto const& marker : read_array(v, "$dates"))
    {
        auto path = read_path(marker);
        if (path.empty())
            throw_invalid_change("date markers can't be empty");
        dates.push_back(std::move(path));
    }
    if (dates.empty())
        return none;
    return dates;
}

value_diff_item
read_value_diff_item(dynamic const& v)
{
    auto const& record = read_map(v, "record");
    auto kind = read_kind(record);

    value_diff_item item;
    try
    {
        if (kind == "E")
        {
            item.change = value_edit{
                read_value_field(record, "lhs"),
                read_value_field(record, "rhs")};
        }
        else if (kind == "N")
        {
            item.change = value_addition{read_value_field(record, "rhs")};
        }
        else if (kind == "D")
        {
            item.change = value_removal{read_value_field(record, "lhs")};
        }
        else if (kind == "A")
        {
            dynamic const* index;
            optional<size_t> parsed_index;
            if (get_field(&index, record, "index"))
                parsed_index = read_index(*index);
            if (!parsed_index)
                throw_invalid_change("array change must have a valid index");
            dynamic const* element;
            if (!get_field(&element, record, "item")
                || element->type() == value_type::NIL)
            {
                throw_invalid_change("array change must have an item");
            }
            item.change = array_change{*parsed_index, read_array_item(*element)};
        }
        else
        {
            throw_invalid_change("invalid record kind");
        }

        dynamic const* field;
        if (get_field(&field, record, "path"))
        {
            auto path = read_path(*field);
            if (!path.empty())
                item.path = std::move(path);
        }
        if (get_field(&field, record, "$dates"))
            item.dates = read_dates(*field);
    }
    catch (invalid_change& e)
    {
        e << change_kind_info(kind);
        throw;
    }
    return item;
}

value_diff
read_value_diff(dynamic const& v)
{
    value_diff diff;
    auto const& records = read_array(v, "record list");
    diff.reserve(records.size());
    for (size_t i = 0; i != records.size(); ++i)
    {
        try
        {
            diff.push_back(read_value_diff_item(records[i]));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, i);
            throw;
        }
    }
    return diff;
}

optional<value_diff>
parse_value_diff_json(string const& json)
{
    auto records = parse_json_value(json);
    if (records.type() == value_type::NIL)
        return none;
    auto diff = read_value_diff(records);
    if (diff.empty())
        return none;
    return diff;
}

} // namespace treediff
