#include <treediff/diff/compute.h>

#include <algorithm>
#include <cmath>

#include <treediff/core/datetime.h>
#include <treediff/utilities/logging.h>

namespace treediff {

namespace {

struct diff_computer
{
    value_diff diff;
    property_path path;
    // lhs containers that are currently being compared
    std::vector<void const*> open_containers;

    void
    compare(dynamic const* lhs, dynamic const* rhs);

    void
    compare_arrays(dynamic_array const& lhs, dynamic_array const& rhs);

    void
    compare_maps(dynamic_map const& lhs, dynamic_map const& rhs);

    void
    compare_field(path_element const& key, dynamic const* lhs, dynamic const* rhs)
    {
        path.push_back(key);
        compare(lhs, rhs);
        path.pop_back();
    }
};

static bool
scalars_equal(dynamic const& lhs, dynamic const& rhs)
{
    if (lhs.type() == value_type::NUMBER)
    {
        double a = cast<double>(lhs), b = cast<double>(rhs);
        return a == b || (std::isnan(a) && std::isnan(b));
    }
    return lhs == rhs;
}

void
diff_computer::compare(dynamic const* lhs, dynamic const* rhs)
{
    auto lhs_type = classify(lhs);
    auto rhs_type = classify(rhs);

    if (!lhs_type)
    {
        if (rhs_type)
            diff.push_back(make_value_addition(path, *rhs));
        return;
    }
    if (!rhs_type)
    {
        diff.push_back(make_value_removal(path, *lhs));
        return;
    }
    if (*lhs_type != *rhs_type)
    {
        diff.push_back(make_value_edit(path, *lhs, *rhs));
        return;
    }

    switch (*lhs_type)
    {
        case value_type::DATETIME:
            if (to_milliseconds_since_epoch(cast<ptime>(*lhs))
                != to_milliseconds_since_epoch(cast<ptime>(*rhs)))
            {
                diff.push_back(make_value_edit(path, *lhs, *rhs));
            }
            break;
        case value_type::ARRAY:
        case value_type::MAP: {
            auto id = container_id(*lhs);
            if (std::find(open_containers.begin(), open_containers.end(), id)
                != open_containers.end())
            {
                break;
            }
            open_containers.push_back(id);
            if (*lhs_type == value_type::ARRAY)
            {
                compare_arrays(
                    cast<dynamic_array>(*lhs), cast<dynamic_array>(*rhs));
            }
            else
            {
                compare_maps(cast<dynamic_map>(*lhs), cast<dynamic_map>(*rhs));
            }
            open_containers.pop_back();
            break;
        }
        case value_type::NIL:
        case value_type::BOOLEAN:
        case value_type::NUMBER:
        case value_type::STRING:
        case value_type::PATTERN:
            // Patterns compare by their canonical string form.
            if (!scalars_equal(*lhs, *rhs))
                diff.push_back(make_value_edit(path, *lhs, *rhs));
            break;
    }
}

void
diff_computer::compare_arrays(
    dynamic_array const& lhs, dynamic_array const& rhs)
{
    size_t common = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i != common; ++i)
        compare_field(i, &lhs[i], &rhs[i]);
    for (size_t i = common; i < lhs.size(); ++i)
        diff.push_back(make_array_change(path, i, array_deletion{lhs[i]}));
    for (size_t i = common; i < rhs.size(); ++i)
        diff.push_back(make_array_change(path, i, array_insertion{rhs[i]}));
}

void
diff_computer::compare_maps(dynamic_map const& lhs, dynamic_map const& rhs)
{
    for (auto const& field : lhs)
    {
        auto other = rhs.find(field.first);
        compare_field(
            field.first,
            &field.second,
            other != rhs.end() ? &other->second : nullptr);
    }
    for (auto const& field : rhs)
    {
        if (lhs.find(field.first) == lhs.end())
            compare_field(field.first, nullptr, &field.second);
    }
}

} // namespace

static optional<value_diff>
compute_diff(dynamic const* lhs, dynamic const* rhs)
{
    diff_computer computer;
    computer.compare(lhs, rhs);
    get_logger()->debug(
        "compute_value_diff: {} difference(s)", computer.diff.size());
    if (computer.diff.empty())
        return none;
    return std::move(computer.diff);
}

optional<value_diff>
compute_value_diff(optional<dynamic> const& lhs, optional<dynamic> const& rhs)
{
    return compute_diff(lhs.get_ptr(), rhs.get_ptr());
}

optional<value_diff>
compute_value_diff(dynamic const& lhs, dynamic const& rhs)
{
    return compute_diff(&lhs, &rhs);
}

} // namespace treediff
