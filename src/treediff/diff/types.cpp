#include <treediff/diff/types.h>

#include <algorithm>
#include <type_traits>

#include <treediff/utilities/text.h>

namespace treediff {

dynamic
to_dynamic(path_element const& e)
{
    if (is_index(e))
        return std::get<size_t>(e);
    return std::get<string>(e);
}

dynamic
to_dynamic(property_path const& path)
{
    dynamic_array array;
    array.reserve(path.size());
    for (auto const& e : path)
        array.push_back(to_dynamic(e));
    return array;
}

std::ostream&
operator<<(std::ostream& os, property_path const& path)
{
    os << "[";
    for (auto i = path.begin(); i != path.end(); ++i)
    {
        if (i != path.begin())
            os << ", ";
        if (is_index(*i))
            os << std::get<size_t>(*i);
        else
            os << std::get<string>(*i);
    }
    os << "]";
    return os;
}

namespace {

struct date_path_collector
{
    date_marker_list paths;
    // containers along the current path
    std::vector<void const*> stack;

    void
    collect(dynamic const& v, property_path& path)
    {
        switch (v.type())
        {
            case value_type::DATETIME:
                paths.push_back(path);
                break;
            case value_type::ARRAY:
            case value_type::MAP: {
                auto id = container_id(v);
                if (std::find(stack.begin(), stack.end(), id) != stack.end())
                    break;
                stack.push_back(id);
                if (v.type() == value_type::ARRAY)
                {
                    auto const& array = cast<dynamic_array>(v);
                    for (size_t i = 0; i != array.size(); ++i)
                    {
                        path.push_back(i);
                        collect(array[i], path);
                        path.pop_back();
                    }
                }
                else
                {
                    for (auto const& field : cast<dynamic_map>(v))
                    {
                        path.push_back(field.first);
                        collect(field.second, path);
                        path.pop_back();
                    }
                }
                stack.pop_back();
                break;
            }
            default:
                break;
        }
    }
};

} // namespace

date_marker_list
collect_date_paths(dynamic const& v, property_path const& prefix)
{
    date_path_collector collector;
    property_path path = prefix;
    collector.collect(v, path);
    return std::move(collector.paths);
}

static optional<property_path>
normalize_path(property_path const& path)
{
    if (path.empty())
        return none;
    return path;
}

static optional<date_marker_list>
normalize_dates(date_marker_list dates)
{
    if (dates.empty())
        return none;
    return dates;
}

static void
append(date_marker_list& dst, date_marker_list const& src)
{
    dst.insert(dst.end(), src.begin(), src.end());
}

std::ostream&
operator<<(std::ostream& s, value_diff_kind kind)
{
    switch (kind)
    {
        case value_diff_kind::EDIT:
            s << "edit";
            break;
        case value_diff_kind::ADDITION:
            s << "addition";
            break;
        case value_diff_kind::REMOVAL:
            s << "removal";
            break;
        case value_diff_kind::ARRAY_CHANGE:
            s << "array_change";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value() << enum_id_info("value_diff_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

char
get_kind_code(value_diff_kind kind)
{
    switch (kind)
    {
        case value_diff_kind::EDIT:
            return 'E';
        case value_diff_kind::ADDITION:
            return 'N';
        case value_diff_kind::REMOVAL:
            return 'D';
        case value_diff_kind::ARRAY_CHANGE:
            return 'A';
        default:
            TREEDIFF_THROW(
                invalid_enum_value() << enum_id_info("value_diff_kind")
                                     << enum_value_info(int(kind)));
    }
}

value_diff_kind
get_kind(value_diff_item const& item)
{
    // The kinds are listed in the same order as the variant's alternatives.
    return static_cast<value_diff_kind>(item.change.index());
}

bool
is_array_deletion(value_diff_item const& item)
{
    auto const* change = std::get_if<array_change>(&item.change);
    return change && std::holds_alternative<array_deletion>(change->item);
}

value_diff_item
make_value_edit(
    property_path const& path, dynamic const& lhs, dynamic const& rhs)
{
    value_diff_item item;
    item.path = normalize_path(path);
    item.change = value_edit{lhs, rhs};
    auto dates = collect_date_paths(lhs, {string("lhs")});
    append(dates, collect_date_paths(rhs, {string("rhs")}));
    item.dates = normalize_dates(std::move(dates));
    return item;
}

value_diff_item
make_value_addition(property_path const& path, dynamic const& rhs)
{
    value_diff_item item;
    item.path = normalize_path(path);
    item.change = value_addition{rhs};
    item.dates = normalize_dates(collect_date_paths(rhs, {string("rhs")}));
    return item;
}

value_diff_item
make_value_removal(property_path const& path, dynamic const& lhs)
{
    value_diff_item item;
    item.path = normalize_path(path);
    item.change = value_removal{lhs};
    item.dates = normalize_dates(collect_date_paths(lhs, {string("lhs")}));
    return item;
}

value_diff_item
make_array_change(
    property_path const& path, size_t index, array_item const& element)
{
    value_diff_item item;
    item.path = normalize_path(path);
    item.change = array_change{index, element};
    if (auto const* insertion = std::get_if<array_insertion>(&element))
    {
        item.dates = normalize_dates(collect_date_paths(
            insertion->rhs, {string("item"), string("rhs")}));
    }
    else
    {
        item.dates = normalize_dates(collect_date_paths(
            std::get<array_deletion>(element).lhs,
            {string("item"), string("lhs")}));
    }
    return item;
}

bool
operator==(value_edit const& a, value_edit const& b)
{
    return a.lhs == b.lhs && a.rhs == b.rhs;
}
bool
operator!=(value_edit const& a, value_edit const& b)
{
    return !(a == b);
}
bool
operator==(value_addition const& a, value_addition const& b)
{
    return a.rhs == b.rhs;
}
bool
operator!=(value_addition const& a, value_addition const& b)
{
    return !(a == b);
}
bool
operator==(value_removal const& a, value_removal const& b)
{
    return a.lhs == b.lhs;
}
bool
operator!=(value_removal const& a, value_removal const& b)
{
    return !(a == b);
}
bool
operator==(array_insertion const& a, array_insertion const& b)
{
    return a.rhs == b.rhs;
}
bool
operator!=(array_insertion const& a, array_insertion const& b)
{
    return !(a == b);
}
bool
operator==(array_deletion const& a, array_deletion const& b)
{
    return a.lhs == b.lhs;
}
bool
operator!=(array_deletion const& a, array_deletion const& b)
{
    return !(a == b);
}
bool
operator==(array_change const& a, array_change const& b)
{
    return a.index == b.index && a.item == b.item;
}
bool
operator!=(array_change const& a, array_change const& b)
{
    return !(a == b);
}
bool
operator==(value_diff_item const& a, value_diff_item const& b)
{
    return a.path == b.path && a.change == b.change && a.dates == b.dates;
}
bool
operator!=(value_diff_item const& a, value_diff_item const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& os, value_diff_item const& item)
{
    auto kind = get_kind(item);
    os << get_kind_code(kind) << " ";
    if (item.path)
        os << *item.path;
    else
        os << "<root>";
    std::visit(
        [&](auto const& change) {
            using change_type = std::decay_t<decltype(change)>;
            if constexpr (std::is_same_v<change_type, value_edit>)
            {
                os << "\nlhs: " << change.lhs << "\nrhs: " << change.rhs;
            }
            else if constexpr (std::is_same_v<change_type, value_addition>)
            {
                os << "\nrhs: " << change.rhs;
            }
            else if constexpr (std::is_same_v<change_type, value_removal>)
            {
                os << "\nlhs: " << change.lhs;
            }
            else
            {
                os << "\nindex: " << change.index;
                if (auto const* insertion
                    = std::get_if<array_insertion>(&change.item))
                {
                    os << "\nitem rhs: " << insertion->rhs;
                }
                else
                {
                    os << "\nitem lhs: "
                       << std::get<array_deletion>(change.item).lhs;
                }
            }
        },
        item.change);
    if (item.dates)
    {
        os << "\n$dates:";
        for (auto const& p : *item.dates)
            os << " " << p;
    }
    return os;
}

} // namespace treediff
