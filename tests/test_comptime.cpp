#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <catch2/catch.hpp>
#include <maybetype/maybetype.hpp>

namespace mt = maybetype;

struct A {};

struct to_string_fn {
	std::string operator()(int x) const { return std::to_string(x); }
};

struct to_optional_fn {
	std::optional<int> operator()(int x) const { return x; }
};

struct to_maybe_fn {
	mt::maybe<char> operator()(int) const { return mt::nothing; }
};

struct to_void_fn {
	void operator()(int) const {}
};

// A user type with its own absent state
struct handle {
	int fd;
};

namespace maybetype {

template <>
struct absence_traits<handle> {
	using value_type = int;

	static constexpr bool nullable = true;

	static constexpr bool is_absent(handle const& h) noexcept {
		return h.fd < 0;
	}

	static constexpr int payload(handle const& h) noexcept {
		return h.fd;
	}
};

} /* namespace maybetype */

TEST_CASE("Comptime 'absence_traits' knows the nullable types", "[comptime:absence_traits]") {
	SECTION("types with an absent state") {
		STATIC_REQUIRE(mt::absence_traits<std::optional<int>>::nullable);
		STATIC_REQUIRE(mt::absence_traits<std::nullopt_t>::nullable);
		STATIC_REQUIRE(mt::absence_traits<mt::none>::nullable);
		STATIC_REQUIRE(mt::absence_traits<mt::maybe<int>>::nullable);
		STATIC_REQUIRE(mt::absence_traits<int*>::nullable);
		STATIC_REQUIRE(mt::absence_traits<int A::*>::nullable);
		STATIC_REQUIRE(mt::absence_traits<std::nullptr_t>::nullable);
		STATIC_REQUIRE(mt::absence_traits<std::shared_ptr<A>>::nullable);
		STATIC_REQUIRE(mt::absence_traits<std::unique_ptr<A>>::nullable);
		STATIC_REQUIRE(mt::absence_traits<std::function<void()>>::nullable);
	}

	SECTION("types that are always present") {
		STATIC_REQUIRE(!mt::absence_traits<int>::nullable);
		STATIC_REQUIRE(!mt::absence_traits<bool>::nullable);
		STATIC_REQUIRE(!mt::absence_traits<std::string>::nullable);
		STATIC_REQUIRE(!mt::absence_traits<std::vector<int>>::nullable);
		STATIC_REQUIRE(!mt::absence_traits<A>::nullable);
	}

	SECTION("arrays decay and are never absent") {
		STATIC_REQUIRE(!mt::absence_traits<char const[4]>::nullable);
		REQUIRE((std::is_same_v<mt::absence_traits<char const[4]>::value_type, char const*>));
		REQUIRE((std::is_same_v<decltype(mt::make_maybe("abc")), mt::maybe<char const*>>));
		REQUIRE((std::is_same_v<decltype(mt::make_maybe<std::string>("abc")), mt::maybe<std::string>>));
	}

	SECTION("payload types") {
		REQUIRE((std::is_same_v<mt::absence_traits<std::optional<A>>::value_type, A>));
		REQUIRE((std::is_same_v<mt::absence_traits<mt::maybe<A>>::value_type, A>));
		REQUIRE((std::is_same_v<mt::absence_traits<A*>::value_type, A*>));
		REQUIRE((std::is_same_v<mt::absence_traits<A>::value_type, A>));
	}
}

TEST_CASE("Comptime 'make_maybe' deduces the payload type", "[comptime:make_maybe]") {
	REQUIRE((std::is_same_v<decltype(mt::make_maybe(1)), mt::maybe<int>>));
	REQUIRE((std::is_same_v<decltype(mt::make_maybe(std::declval<std::optional<A>&>())), mt::maybe<A>>));
	REQUIRE((std::is_same_v<decltype(mt::make_maybe(std::declval<mt::maybe<A> const&>())), mt::maybe<A>>));
	REQUIRE((std::is_same_v<decltype(mt::make_maybe(std::declval<A const*>())), mt::maybe<A const*>>));
	REQUIRE((std::is_same_v<decltype(mt::make_maybe<long>(1)), mt::maybe<long>>));
	REQUIRE((std::is_same_v<decltype(mt::make_maybe<A>(mt::nothing)), mt::maybe<A>>));
}

TEST_CASE("Comptime 'make_maybe' respects custom absence traits", "[comptime:make_maybe]") {
	REQUIRE((std::is_same_v<decltype(mt::make_maybe(handle{3})), mt::maybe<int>>));
	REQUIRE(mt::make_maybe(handle{3}) == mt::make_maybe(3));
	REQUIRE(mt::make_maybe(handle{-1}).is_none());
}

TEST_CASE("Comptime combinator result types", "[comptime:combinators]") {
	using m = mt::maybe<int>;

	SECTION("then leaves the maybe") {
		REQUIRE((std::is_same_v<decltype(std::declval<m>().then(to_string_fn())), std::optional<std::string>>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().then(to_optional_fn())), std::optional<int>>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().then(to_void_fn())), void>));
	}

	SECTION("and_then stays in the maybe") {
		REQUIRE((std::is_same_v<decltype(std::declval<m>().and_then(to_string_fn())), mt::maybe<std::string>>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().and_then(to_maybe_fn())), mt::maybe<mt::maybe<char>>>));
	}

	SECTION("get deduces the element type") {
		using vec = mt::maybe<std::vector<A>>;
		using dict = mt::maybe<std::map<std::string, int>>;

		REQUIRE((std::is_same_v<decltype(std::declval<vec>().get(0)), mt::maybe<A>>));
		REQUIRE((std::is_same_v<decltype(std::declval<dict>().get(std::string())), mt::maybe<int>>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().get<A>(0)), mt::maybe<A>>));
	}

	SECTION("unwrap by value-category") {
		REQUIRE((std::is_same_v<decltype(std::declval<m const&>().unwrap()), int const&>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().unwrap()), int>));
	}

	SECTION("collection utilities") {
		REQUIRE((std::is_same_v<decltype(mt::cat(std::declval<std::vector<m>&>())), std::vector<int>>));
		REQUIRE((std::is_same_v<decltype(mt::map_maybe(mt::parse_int, std::declval<std::string&>())), std::vector<int>>));
		REQUIRE((std::is_same_v<decltype(mt::flatten(std::declval<mt::maybe<m>>())), m>));
	}
}

TEST_CASE("Comptime accessors never expose a mutable payload", "[comptime:accessors]") {
	using m = mt::maybe<int*>;
	using variant_t = std::variant<mt::some<int*>, mt::none>;

	SECTION("lvalues are read through const references") {
		REQUIRE((std::is_same_v<decltype(std::declval<m&>().some().value()), int* const&>));
		REQUIRE((std::is_same_v<decltype(std::declval<m&>().some()), mt::some<int*> const&>));
		REQUIRE((std::is_same_v<decltype(std::declval<m&>().none()), mt::none const&>));
		REQUIRE((std::is_same_v<decltype(std::declval<m&>().as_variant()), variant_t const&>));
		STATIC_REQUIRE(!std::is_assignable_v<decltype(std::declval<m&>().some().value()), std::nullptr_t>);
		STATIC_REQUIRE(!std::is_assignable_v<decltype(std::declval<m&>().as_variant()), mt::none>);
	}

	SECTION("rvalues hand out copies") {
		REQUIRE((std::is_same_v<decltype(std::declval<m>().some().value()), int*>));
		REQUIRE((std::is_same_v<decltype(std::declval<m>().as_variant()), variant_t>));
		REQUIRE((std::is_same_v<decltype(std::declval<mt::some<int>>().value()), int>));
	}
}

TEST_CASE("Comptime detection of keyed access", "[comptime:detail]") {
	STATIC_REQUIRE(mt::detail::is_indexable_v<std::vector<int> const&, int const&>);
	STATIC_REQUIRE(mt::detail::is_indexable_v<std::map<std::string, int> const&, std::string const&>);
	STATIC_REQUIRE(mt::detail::is_indexable_v<std::string const&, int const&>);
	STATIC_REQUIRE(!mt::detail::is_indexable_v<int const&, int const&>);
	STATIC_REQUIRE(!mt::detail::is_indexable_v<A const&, int const&>);
}

TEST_CASE("Comptime maybes can be constant expressions", "[comptime:constexpr]") {
	constexpr mt::maybe<int> present = mt::some(3);
	constexpr mt::maybe<int> absent = mt::nothing;

	STATIC_REQUIRE(present.is_some());
	STATIC_REQUIRE(present.some().value() == 3);
	STATIC_REQUIRE(absent.is_none());
	STATIC_REQUIRE(present != absent);
	STATIC_REQUIRE(mt::parse_int(5).some().value() == 5);
	STATIC_REQUIRE(mt::parse_int(1LL << 40).is_none());
}
