#include <treediff/diff/apply.h>

#include <treediff/core/datetime.h>
#include <treediff/diff/compute.h>
#include <treediff/diff/encoding.h>
#include <treediff/utilities/testing.h>

using namespace treediff;

// Check that applying the differences between :lhs and :rhs to a copy of
// :lhs yields :rhs and that reverting them brings back :lhs.
static void
test_round_trip(dynamic const& lhs, dynamic const& rhs)
{
    CAPTURE(lhs);
    CAPTURE(rhs);

    auto diff = compute_value_diff(lhs, rhs);
    REQUIRE(bool(diff));

    dynamic target = deep_copy(lhs);
    apply_value_diff(target, diff);
    REQUIRE(target == rhs);

    revert_value_diff(target, diff);
    REQUIRE(target == lhs);
}

TEST_CASE("applying and reverting differences", "[diff][apply]")
{
    test_round_trip(
        dynamic{
            {"name", "a"},
            {"xs", dynamic{1, 2, 3}},
            {"nested", dynamic{{"k", 1}, {"gone", true}}}},
        dynamic{
            {"name", "b"},
            {"xs", dynamic{9}},
            {"nested", dynamic{{"k", 2}, {"fresh", nil}}},
            {"added", dynamic{{"deep", dynamic{1}}}}});

    test_round_trip(
        dynamic{{"a", dynamic{1, "x"}}},
        dynamic{{"a", dynamic{{"x", 1}}}});

    test_round_trip(
        dynamic{{"t", make_test_time(2017, 1, 1)}},
        dynamic{{"t", make_test_time(2018, 1, 1)}});
}

TEST_CASE("shrinking arrays", "[diff][apply]")
{
    dynamic_array long_array;
    for (int i = 0; i != 12; ++i)
        long_array.push_back(i);
    dynamic lhs{{"a", long_array}};
    dynamic rhs{{"a", dynamic{0}}};

    auto diff = compute_value_diff(lhs, rhs);
    REQUIRE(bool(diff));
    REQUIRE(diff->size() == 11);

    dynamic target = deep_copy(lhs);
    apply_value_diff(target, diff);
    REQUIRE(target == rhs);

    revert_value_diff(target, diff);
    REQUIRE(target == lhs);
}

TEST_CASE("growing arrays", "[diff][apply]")
{
    test_round_trip(
        dynamic{{"a", dynamic{1}}}, dynamic{{"a", dynamic{1, 2, 3, 4}}});
    test_round_trip(
        dynamic{{"a", dynamic{1, 2}}}, dynamic{{"a", dynamic{5, 2, 3}}});
}

TEST_CASE("dates through JSON", "[diff][apply]")
{
    auto t = make_test_time(2017, 4, 26, 1, 2, 3, 456);
    dynamic lhs{{"a", 1}, {"xs", dynamic_array()}};
    dynamic rhs{{"a", 1}, {"when", t}, {"xs", dynamic{dynamic{{"at", t}}}}};

    auto diff = compute_value_diff(lhs, rhs);
    auto parsed = parse_value_diff_json(value_diff_to_json(diff));
    REQUIRE(bool(parsed));
    REQUIRE(parsed->size() == 2);

    // The array change comes first, then the addition. The datetimes come
    // back as strings.
    auto const& addition = std::get<value_addition>((*parsed)[1].change);
    REQUIRE(addition.rhs == dynamic(to_value_string(t)));

    // ... and are restored when applied.
    dynamic target = deep_copy(lhs);
    apply_value_diff(target, parsed);
    REQUIRE(target == rhs);
    REQUIRE(
        get_field(cast<dynamic_map>(target), "when").type()
        == value_type::DATETIME);

    // The records themselves aren't touched.
    REQUIRE(addition.rhs.type() == value_type::STRING);

    revert_value_diff(target, parsed);
    REQUIRE(target == lhs);
}

TEST_CASE("edited dates through JSON", "[diff][apply]")
{
    auto t1 = make_test_time(2017, 4, 26, 1, 2, 3, 456);
    auto t2 = make_test_time(2019, 11, 2, 23, 59, 58, 7);
    dynamic lhs{{"t", t1}};
    dynamic rhs{{"t", t2}};

    auto parsed = parse_value_diff_json(
        value_diff_to_json(compute_value_diff(lhs, rhs)));
    REQUIRE(bool(parsed));
    REQUIRE(parsed->size() == 1);
    auto const& edit = std::get<value_edit>((*parsed)[0].change);
    REQUIRE(edit.lhs.type() == value_type::STRING);
    REQUIRE(edit.rhs.type() == value_type::STRING);
    REQUIRE(bool((*parsed)[0].dates));
    REQUIRE(
        *(*parsed)[0].dates
        == (date_marker_list{property_path{"lhs"}, property_path{"rhs"}}));

    dynamic target = deep_copy(lhs);
    apply_value_diff(target, parsed);
    auto const& applied = get_field(cast<dynamic_map>(target), "t");
    REQUIRE(applied.type() == value_type::DATETIME);
    REQUIRE(cast<ptime>(applied) == t2);

    revert_value_diff(target, parsed);
    auto const& reverted = get_field(cast<dynamic_map>(target), "t");
    REQUIRE(reverted.type() == value_type::DATETIME);
    REQUIRE(cast<ptime>(reverted) == t1);
}

TEST_CASE("strings without date markers", "[diff][apply]")
{
    dynamic target = dynamic_map();
    apply_change(
        target,
        dynamic{
            {"kind", "N"},
            {"path", dynamic{"when"}},
            {"rhs", "2017-04-26T01:02:03.000Z"}});
    REQUIRE(target == (dynamic{{"when", "2017-04-26T01:02:03.000Z"}}));
}

TEST_CASE("invalid date markers", "[diff][apply]")
{
    dynamic target{{"a", 1}};

    auto item = make_value_addition({"b"}, 2);
    item.dates = date_marker_list{property_path{"rhs"}};
    REQUIRE_THROWS_AS(apply_change(target, item), invalid_change);

    item = make_value_addition({"b"}, "yesterday");
    item.dates = date_marker_list{property_path{"rhs"}};
    REQUIRE_THROWS_AS(apply_change(target, item), invalid_change);

    item = make_value_addition({"b"}, dynamic{{"x", 1}});
    item.dates = date_marker_list{property_path{"rhs", "y"}};
    REQUIRE_THROWS_AS(apply_change(target, item), invalid_change);

    REQUIRE(target == (dynamic{{"a", 1}}));
}

TEST_CASE("invalid targets", "[diff][apply]")
{
    dynamic target;
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_addition({"a"}, 1)), invalid_target);
    target = 5;
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_addition({"a"}, 1)), invalid_target);
    REQUIRE_THROWS_AS(
        revert_change(target, make_value_addition({"a"}, 1)), invalid_target);
    REQUIRE(target == dynamic(5));

    // The target is checked before a serialized record is decoded.
    dynamic malformed{{"kind", "A"}, {"path", dynamic{"xs"}}};
    target = nil;
    REQUIRE_THROWS_AS(apply_change(target, malformed), invalid_target);
    REQUIRE_THROWS_AS(revert_change(target, malformed), invalid_target);
    target = 5;
    REQUIRE_THROWS_AS(apply_change(target, malformed), invalid_target);

    // A nil target ignores even a malformed list.
    target = nil;
    apply_value_diff(target, dynamic{malformed});
    REQUIRE(target == dynamic(nil));
}

TEST_CASE("reverting root records", "[diff][apply]")
{
    dynamic target{{"a", 1}};
    REQUIRE_THROWS_AS(
        revert_change(target, make_value_edit({}, 1, 2)), empty_path);
    target = dynamic{1, 2};
    REQUIRE_THROWS_AS(
        revert_change(target, make_array_change({}, 1, array_deletion{2})),
        empty_path);
    REQUIRE(target == (dynamic{1, 2}));
}

TEST_CASE("malformed serialized records", "[diff][apply]")
{
    dynamic target{{"xs", dynamic{1}}};
    REQUIRE_THROWS_AS(
        apply_change(
            target,
            dynamic{
                {"kind", "A"},
                {"path", dynamic{"xs"}},
                {"item", dynamic{{"kind", "N"}, {"rhs", 2}}}}),
        invalid_change);
    REQUIRE(target == (dynamic{{"xs", dynamic{1}}}));
}

TEST_CASE("paths through scalars", "[diff][apply]")
{
    dynamic target{{"a", 5}};
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_addition({"a", "b"}, 1)), not_object);
    REQUIRE(target == (dynamic{{"a", 5}}));

    try
    {
        apply_change(target, make_value_addition({"a", "b"}, 1));
        FAIL("no exception thrown");
    }
    catch (not_object& e)
    {
        REQUIRE(
            get_required_error_info<diff_path_info>(e)
            == (dynamic{"a", "b"}));
        REQUIRE(
            get_required_error_info<found_value_type_info>(e)
            == value_type::NUMBER);
    }

    // An array_change needs an array.
    REQUIRE_THROWS_AS(
        apply_change(
            target, make_array_change({"a"}, 0, array_insertion{1})),
        not_object);
    REQUIRE(target == (dynamic{{"a", 5}}));
}

TEST_CASE("invalid paths", "[diff][apply]")
{
    dynamic target{{"xs", dynamic{1}}, {"m", dynamic_map()}};
    auto original = deep_copy(target);

    // a map key applied to an array
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_edit({"xs", "k"}, 1, 2)),
        invalid_path);
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_addition({"xs", "k", "j"}, 2)),
        invalid_path);
    // an array_change applied to a map
    REQUIRE_THROWS_AS(
        apply_change(target, make_array_change({"m"}, 0, array_insertion{1})),
        invalid_path);
    // a root array_change applied to a map
    REQUIRE_THROWS_AS(
        apply_change(target, make_array_change({}, 0, array_insertion{1})),
        invalid_path);

    REQUIRE(target == original);
}

TEST_CASE("creating intermediate containers", "[diff][apply]")
{
    dynamic target = dynamic_map();
    apply_change(target, make_value_addition({"a", size_t(0), "b"}, 1));
    REQUIRE(target == (dynamic{{"a", dynamic{dynamic{{"b", 1}}}}}));

    // Nil values along the path are replaced too.
    target = dynamic{{"a", nil}};
    apply_change(target, make_value_addition({"a", "b"}, 1));
    REQUIRE(target == (dynamic{{"a", dynamic{{"b", 1}}}}));

    // A missing array is created for an array_change.
    target = dynamic_map();
    apply_change(target, make_array_change({"xs"}, 0, array_insertion{1}));
    REQUIRE(target == (dynamic{{"xs", dynamic{1}}}));
}

TEST_CASE("indices applied to maps", "[diff][apply]")
{
    dynamic target{{"m", dynamic_map()}};
    apply_change(target, make_value_addition({"m", size_t(0)}, "x"));
    REQUIRE(target == (dynamic{{"m", dynamic{{"0", "x"}}}}));

    revert_change(target, make_value_addition({"m", size_t(0)}, "x"));
    REQUIRE(target == (dynamic{{"m", dynamic_map()}}));
}

TEST_CASE("array changes out of range", "[diff][apply]")
{
    dynamic target{{"xs", dynamic{1}}};

    // Inserting past the end pads the array with nils.
    apply_change(target, make_array_change({"xs"}, 3, array_insertion{4}));
    REQUIRE(target == (dynamic{{"xs", dynamic{1, nil, nil, 4}}}));

    // Deleting past the end does nothing.
    apply_change(target, make_array_change({"xs"}, 9, array_deletion{0}));
    REQUIRE(target == (dynamic{{"xs", dynamic{1, nil, nil, 4}}}));
}

TEST_CASE("indices far past the end", "[diff][apply]")
{
    dynamic target{{"xs", dynamic{1, 2}}};
    auto original = deep_copy(target);

    size_t const too_far = 2 + max_array_padding + 1;

    REQUIRE_THROWS_AS(
        apply_change(
            target,
            make_array_change({"xs"}, too_far, array_insertion{3})),
        invalid_path);
    REQUIRE_THROWS_AS(
        apply_change(
            target,
            dynamic{
                {"kind", "A"},
                {"path", dynamic{"xs"}},
                {"index", 1e12},
                {"item", dynamic{{"kind", "N"}, {"rhs", 3}}}}),
        invalid_path);
    REQUIRE_THROWS_AS(
        apply_change(target, make_value_addition({"xs", too_far}, 3)),
        invalid_path);
    REQUIRE_THROWS_AS(
        revert_change(
            target, make_array_change({"xs"}, too_far, array_deletion{3})),
        invalid_path);
    // Nothing is created along the way when a new array would be too long.
    REQUIRE_THROWS_AS(
        apply_change(
            target,
            make_value_addition({"new", size_t(1e12), "x"}, 3)),
        invalid_path);
    REQUIRE_THROWS_AS(
        apply_change(
            target, make_array_change({"new"}, size_t(1e12), array_insertion{3})),
        invalid_path);
    REQUIRE(target == original);

    // Erasing is fine however far past the end the index is.
    apply_change(
        target, make_array_change({"xs"}, size_t(1e12), array_deletion{3}));
    revert_change(target, make_array_change({"xs"}, too_far, array_insertion{3}));
    apply_change(target, make_value_removal({"xs", size_t(1e12)}, 3));
    REQUIRE(target == original);

    // Root-level insertions are bounded too.
    dynamic array{1};
    REQUIRE_THROWS_AS(
        apply_change(array, make_array_change({}, too_far, array_insertion{3})),
        invalid_path);
    REQUIRE(array == (dynamic{1}));
}

TEST_CASE("applied values are copies", "[diff][apply]")
{
    dynamic value{{"x", 1}};
    auto item = make_value_addition({"a"}, value);

    dynamic target = dynamic_map();
    apply_change(target, item);
    auto const& written = get_field(cast<dynamic_map>(target), "a");
    REQUIRE(written == value);
    REQUIRE(!same_container(written, value));

    cast<dynamic_map>(value)["x"] = 2;
    REQUIRE(target == (dynamic{{"a", dynamic{{"x", 1}}}}));
}

TEST_CASE("root records", "[diff][apply]")
{
    dynamic target{{"a", 1}};
    apply_change(target, make_value_edit({}, dynamic{{"a", 1}}, dynamic{1, 2}));
    REQUIRE(target == (dynamic{1, 2}));

    apply_change(target, make_array_change({}, 2, array_insertion{3}));
    REQUIRE(target == (dynamic{1, 2, 3}));

    apply_change(target, make_array_change({}, 0, array_deletion{1}));
    REQUIRE(target == (dynamic{2, 3}));

    apply_change(target, make_value_removal({}, dynamic{2, 3}));
    REQUIRE(target == dynamic(nil));
}

TEST_CASE("empty differences", "[diff][apply]")
{
    dynamic target{{"a", 1}};
    apply_value_diff(target, none);
    apply_value_diff(target, value_diff());
    apply_value_diff(target, dynamic(nil));
    revert_value_diff(target, none);
    REQUIRE(target == (dynamic{{"a", 1}}));

    // Nothing is applied to a nil target.
    dynamic nil_target;
    apply_value_diff(nil_target, some(value_diff{make_value_addition({"a"}, 1)}));
    REQUIRE(nil_target == dynamic(nil));
}

TEST_CASE("serialized record lists", "[diff][apply]")
{
    dynamic lhs{{"a", 1}, {"xs", dynamic{1, 2, 3}}};
    dynamic rhs{{"a", 2}, {"xs", dynamic{1}}};
    auto diff = compute_value_diff(lhs, rhs);
    REQUIRE(bool(diff));

    dynamic target = deep_copy(lhs);
    apply_value_diff(target, value_diff_to_dynamic(*diff));
    REQUIRE(target == rhs);
}

TEST_CASE("failing records", "[diff][apply]")
{
    dynamic target{{"a", 1}};
    value_diff diff{
        make_value_edit({"a"}, 1, 2),
        make_value_addition({"a", "b"}, 1),
        make_value_addition({"c"}, 3)};
    REQUIRE_THROWS_AS(apply_value_diff(target, some(diff)), not_object);
    // The records before the failing one stay applied.
    REQUIRE(target == (dynamic{{"a", 2}}));
}
