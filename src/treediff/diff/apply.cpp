#include <treediff/diff/apply.h>

#include <algorithm>

#include <treediff/core/datetime.h>
#include <treediff/diff/encoding.h>
#include <treediff/utilities/logging.h>
#include <treediff/utilities/text.h>

namespace treediff {

static string
get_kind_string(value_diff_item const& item)
{
    return string(1, get_kind_code(get_kind(item)));
}

static void
check_target(dynamic const& target, value_diff_item const& item)
{
    if (!is_container(target.type()))
    {
        TREEDIFF_THROW(
            invalid_target() << change_kind_info(get_kind_string(item))
                             << found_value_type_info(target.type()));
    }
}

// Same, but for a record that hasn't been decoded yet.
static void
check_record_target(dynamic const& target)
{
    if (!is_container(target.type()))
        TREEDIFF_THROW(invalid_target() << found_value_type_info(target.type()));
}

// DATE REVIVAL

// Follow :marker (with its side prefix already removed) into :value and
// restore the datetime at the end.
static void
revive_date(dynamic& value, property_path const& marker, size_t start)
{
    dynamic* leaf = &value;
    for (size_t i = start; i != marker.size(); ++i)
    {
        auto const& e = marker[i];
        dynamic* next = nullptr;
        if (leaf->type() == value_type::MAP && !is_index(e))
            get_field(&next, cast<dynamic_map>(*leaf), std::get<string>(e));
        else if (leaf->type() == value_type::ARRAY && is_index(e))
        {
            auto& array = cast<dynamic_array>(*leaf);
            if (std::get<size_t>(e) < array.size())
                next = &array[std::get<size_t>(e)];
        }
        if (!next)
        {
            TREEDIFF_THROW(
                invalid_change()
                << diff_path_info(to_dynamic(marker))
                << diff_error_message_info(
                       "date marker doesn't lead to a value"));
        }
        leaf = next;
    }
    switch (leaf->type())
    {
        case value_type::DATETIME:
            break;
        case value_type::STRING:
            try
            {
                *leaf = parse_ptime(cast<string>(*leaf));
            }
            catch (parsing_error& e)
            {
                TREEDIFF_THROW(
                    invalid_change()
                    << diff_path_info(to_dynamic(marker))
                    << parsed_text_info(
                           get_required_error_info<parsed_text_info>(e))
                    << diff_error_message_info(
                           "date marker refers to an invalid timestamp"));
            }
            break;
        default:
            TREEDIFF_THROW(
                invalid_change() << diff_path_info(to_dynamic(marker))
                                 << found_value_type_info(leaf->type())
                                 << diff_error_message_info(
                                        "date marker refers to a non-date"));
    }
}

static bool
starts_with(property_path const& path, property_path const& prefix)
{
    return path.size() >= prefix.size()
           && std::equal(prefix.begin(), prefix.end(), path.begin());
}

// Get a copy of :value with the dates marked under :side restored.
static dynamic
prepare_value(
    dynamic const& value,
    optional<date_marker_list> const& dates,
    property_path const& side)
{
    dynamic copy = deep_copy(value);
    if (dates)
    {
        for (auto const& marker : *dates)
        {
            if (starts_with(marker, side))
                revive_date(copy, marker, side.size());
        }
    }
    return copy;
}

// PATH RESOLUTION

static string
get_map_key(path_element const& e)
{
    if (is_index(e))
        return lexical_cast<string>(std::get<size_t>(e));
    return std::get<string>(e);
}

static void
throw_invalid_path(property_path const& path, path_element const& e)
{
    TREEDIFF_THROW(
        invalid_path() << diff_path_info(to_dynamic(path))
                       << path_element_info(to_dynamic(e)));
}

// Get the child of :parent (which must be a container) at :e.
// If it doesn't exist, this either creates it as nil (if :create is true) or
// returns nullptr.
static dynamic*
get_child(
    dynamic& parent,
    path_element const& e,
    bool create,
    property_path const& path)
{
    if (parent.type() == value_type::MAP)
    {
        auto& map = cast<dynamic_map>(parent);
        auto key = get_map_key(e);
        auto i = map.find(key);
        if (i != map.end())
            return &i->second;
        return create ? &map[key] : nullptr;
    }
    auto& array = cast<dynamic_array>(parent);
    if (!is_index(e))
        throw_invalid_path(path, e);
    auto index = std::get<size_t>(e);
    if (index < array.size())
        return &array[index];
    if (!create)
        return nullptr;
    array.resize(index + 1);
    return &array[index];
}

// Walk all but the last element of :path and return the container that the
// last element addresses, creating whatever is missing along the way.
// The path must have been checked with check_path().
static dynamic*
resolve_parent(dynamic& target, property_path const& path)
{
    dynamic* current = &target;
    for (size_t i = 0; i + 1 < path.size(); ++i)
    {
        dynamic* child = get_child(*current, path[i], true, path);
        if (child->type() == value_type::NIL)
        {
            if (is_index(path[i + 1]))
                *child = dynamic_array();
            else
                *child = dynamic_map();
        }
        current = child;
    }
    return current;
}

// Check that reaching :index in an array of :size elements doesn't pad it
// by more than max_array_padding.
static void
check_padding(size_t size, size_t index, property_path const& path)
{
    if (index > size && index - size > max_array_padding)
    {
        TREEDIFF_THROW(
            invalid_path()
            << diff_path_info(to_dynamic(path))
            << path_element_info(dynamic(index))
            << diff_error_message_info("index is too far past the end"));
    }
}

// Check that :item can be carried out at :path in :target without changing
// anything. :reverting tells which direction it will be carried out in.
static void
check_path(
    dynamic& target,
    property_path const& path,
    value_diff_item const& item,
    bool reverting)
{
    auto kind = get_kind(item);
    // Is a value written at the end of :path (as opposed to erased)?
    bool writes = kind == value_diff_kind::EDIT
                  || kind == value_diff_kind::ARRAY_CHANGE
                  || (kind == value_diff_kind::ADDITION && !reverting)
                  || (kind == value_diff_kind::REMOVAL && reverting);

    // :current is the container that path[i] addresses. It's null once the
    // walk reaches values that don't exist yet (and will be created).
    dynamic* current = &target;
    for (size_t i = 0; i != path.size(); ++i)
    {
        auto const& e = path[i];
        bool checks_padding = writes || i + 1 != path.size();
        if (!current || current->type() == value_type::NIL)
        {
            // A container will be created here.
            if (checks_padding && is_index(e))
                check_padding(0, std::get<size_t>(e), path);
            current = nullptr;
            continue;
        }
        if (!is_container(current->type()))
        {
            TREEDIFF_THROW(
                not_object() << diff_path_info(to_dynamic(path))
                             << path_element_info(to_dynamic(path[i - 1]))
                             << found_value_type_info(current->type()));
        }
        if (current->type() == value_type::ARRAY)
        {
            if (!is_index(e))
                throw_invalid_path(path, e);
            if (checks_padding)
            {
                check_padding(
                    cast<dynamic_array>(*current).size(),
                    std::get<size_t>(e),
                    path);
            }
        }
        current = get_child(*current, e, false, path);
    }

    auto const* change = std::get_if<array_change>(&item.change);
    if (!change)
        return;
    size_t size = 0;
    if (current && current->type() != value_type::NIL)
    {
        if (current->type() == value_type::MAP)
            throw_invalid_path(path, path.back());
        if (current->type() != value_type::ARRAY)
        {
            TREEDIFF_THROW(
                not_object() << diff_path_info(to_dynamic(path))
                             << path_element_info(to_dynamic(path.back()))
                             << found_value_type_info(current->type()));
        }
        size = cast<dynamic_array>(*current).size();
    }
    bool inserts = std::holds_alternative<array_insertion>(change->item)
                   != reverting;
    if (inserts)
        check_padding(size, change->index, path);
}

// ELEMENTARY OPERATIONS

static void
set_child(dynamic& parent, path_element const& e, dynamic value)
{
    // The path has already been checked, so this can't fail.
    dynamic* child = get_child(parent, e, true, property_path());
    *child = std::move(value);
}

static void
erase_child(dynamic& parent, path_element const& e)
{
    if (parent.type() == value_type::MAP)
    {
        cast<dynamic_map>(parent).erase(get_map_key(e));
    }
    else
    {
        auto& array = cast<dynamic_array>(parent);
        auto index = std::get<size_t>(e);
        if (index < array.size())
            array.erase(array.begin() + index);
    }
}

static void
insert_element(dynamic_array& array, size_t index, dynamic value)
{
    if (index > array.size())
        array.resize(index);
    array.insert(array.begin() + index, std::move(value));
}

static void
erase_element(dynamic_array& array, size_t index)
{
    if (index < array.size())
        array.erase(array.begin() + index);
}

// Get the array that an array_change at :path acts on, creating it if it's
// missing.
static dynamic_array&
get_array(dynamic& target, optional<property_path> const& path)
{
    if (!path)
        return cast<dynamic_array>(target);
    dynamic* parent = resolve_parent(target, *path);
    dynamic* array = get_child(*parent, path->back(), true, *path);
    if (array->type() == value_type::NIL)
        *array = dynamic_array();
    return cast<dynamic_array>(*array);
}

// Check that a root-level array_change can act on :target.
static void
check_root_array(dynamic const& target, array_change const& change)
{
    if (target.type() != value_type::ARRAY)
    {
        TREEDIFF_THROW(
            invalid_path() << diff_path_info(dynamic(dynamic_array()))
                           << found_value_type_info(target.type()));
    }
    if (std::holds_alternative<array_insertion>(change.item))
    {
        check_padding(
            cast<dynamic_array>(target).size(), change.index, property_path());
    }
}

static void
trace_change(char const* action, value_diff_item const& item)
{
    auto logger = get_logger();
    if (logger->should_log(spdlog::level::trace))
        logger->trace("{} {}", action, lexical_cast<string>(item));
}

// APPLY

void
apply_change(dynamic& target, value_diff_item const& item)
{
    check_target(target, item);
    trace_change("applying", item);

    if (auto const* change = std::get_if<array_change>(&item.change))
    {
        optional<dynamic> value;
        if (auto const* insertion = std::get_if<array_insertion>(&change->item))
        {
            value = prepare_value(
                insertion->rhs, item.dates, {string("item"), string("rhs")});
        }
        if (item.path)
            check_path(target, *item.path, item, false);
        else
            check_root_array(target, *change);
        auto& array = get_array(target, item.path);
        if (value)
            insert_element(array, change->index, std::move(*value));
        else
            erase_element(array, change->index);
        return;
    }

    // Removals don't write a value.
    optional<dynamic> value;
    if (auto const* edit = std::get_if<value_edit>(&item.change))
        value = prepare_value(edit->rhs, item.dates, {string("rhs")});
    else if (auto const* addition = std::get_if<value_addition>(&item.change))
        value = prepare_value(addition->rhs, item.dates, {string("rhs")});

    if (!item.path)
    {
        target = value ? std::move(*value) : dynamic(nil);
        return;
    }

    auto const& path = *item.path;
    check_path(target, path, item, false);
    dynamic* parent = resolve_parent(target, path);
    if (value)
        set_child(*parent, path.back(), std::move(*value));
    else
        erase_child(*parent, path.back());
}

void
apply_change(dynamic& target, dynamic const& record)
{
    check_record_target(target);
    apply_change(target, read_value_diff_item(record));
}

// REVERT

void
revert_change(dynamic& target, value_diff_item const& item)
{
    check_target(target, item);
    if (!item.path)
    {
        TREEDIFF_THROW(
            empty_path() << change_kind_info(get_kind_string(item)));
    }
    trace_change("reverting", item);

    auto const& path = *item.path;

    if (auto const* change = std::get_if<array_change>(&item.change))
    {
        optional<dynamic> value;
        if (auto const* deletion = std::get_if<array_deletion>(&change->item))
        {
            value = prepare_value(
                deletion->lhs, item.dates, {string("item"), string("lhs")});
        }
        check_path(target, path, item, true);
        auto& array = get_array(target, item.path);
        if (value)
            insert_element(array, change->index, std::move(*value));
        else
            erase_element(array, change->index);
        return;
    }

    // Reverting an addition doesn't write a value.
    optional<dynamic> value;
    if (auto const* edit = std::get_if<value_edit>(&item.change))
        value = prepare_value(edit->lhs, item.dates, {string("lhs")});
    else if (auto const* removal = std::get_if<value_removal>(&item.change))
        value = prepare_value(removal->lhs, item.dates, {string("lhs")});

    check_path(target, path, item, true);
    dynamic* parent = resolve_parent(target, path);
    if (value)
        set_child(*parent, path.back(), std::move(*value));
    else
        erase_child(*parent, path.back());
}

void
revert_change(dynamic& target, dynamic const& record)
{
    check_record_target(target);
    revert_change(target, read_value_diff_item(record));
}

// WHOLE LISTS

// Get the order in which the records in :diff should be applied.
static std::vector<value_diff_item const*>
get_application_order(value_diff const& diff)
{
    std::vector<value_diff_item const*> order;
    order.reserve(diff.size());
    std::vector<size_t> deletion_slots;
    std::vector<value_diff_item const*> deletions;
    for (auto const& item : diff)
    {
        if (is_array_deletion(item))
        {
            deletion_slots.push_back(order.size());
            deletions.push_back(&item);
        }
        order.push_back(&item);
    }
    if (deletions.empty())
        return order;

    // The deletions keep the slots they occupy, but they're reordered among
    // themselves by descending index.
    std::stable_sort(
        deletions.begin(),
        deletions.end(),
        [](value_diff_item const* a, value_diff_item const* b) {
            return std::get<array_change>(a->change).index
                   > std::get<array_change>(b->change).index;
        });
    for (size_t i = 0; i != deletions.size(); ++i)
        order[deletion_slots[i]] = deletions[i];
    return order;
}

void
apply_value_diff(dynamic& target, optional<value_diff> const& diff)
{
    if (target.type() == value_type::NIL || !diff || diff->empty())
        return;
    get_logger()->debug("apply_value_diff: {} record(s)", diff->size());
    for (auto const* item : get_application_order(*diff))
        apply_change(target, *item);
}

void
apply_value_diff(dynamic& target, dynamic const& records)
{
    if (target.type() == value_type::NIL || records.type() == value_type::NIL)
        return;
    apply_value_diff(target, some(read_value_diff(records)));
}

void
revert_value_diff(dynamic& target, optional<value_diff> const& diff)
{
    if (target.type() == value_type::NIL || !diff || diff->empty())
        return;
    get_logger()->debug("revert_value_diff: {} record(s)", diff->size());
    auto order = get_application_order(*diff);
    for (auto i = order.rbegin(); i != order.rend(); ++i)
        revert_change(target, **i);
}

} // namespace treediff
