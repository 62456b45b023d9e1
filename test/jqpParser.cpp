#include "JQPParser.hpp"
#include <catch2/catch.hpp>

using namespace std;
using jqp::ParseError;
using jqp::PathParser;
using jqp::PathStep;

// Helper returning the kind of the ParseError thrown by parse
static ParseError::Kind parse_error_kind(const string &path)
{
	try
	{
		PathParser::parse(path);
	}
	catch (const ParseError &e)
	{
		return e.kind();
	}
	FAIL("expected ParseError for " << path);
	return ParseError::Kind::MissingLeadingDot;
}

TEST_CASE("Root path parses to no steps", "[parser][root]")
{
	REQUIRE(PathParser::parse(".").empty());
	// a lone flatten marker still addresses the root
	REQUIRE(PathParser::parse(".[]").empty());
}

TEST_CASE("Dotted fields and indices", "[parser][field][index]")
{
	auto steps = PathParser::parse(".root.array[1].property");
	REQUIRE(steps.size() == 4);
	REQUIRE(steps[0] == PathStep::field("root"));
	REQUIRE(steps[1] == PathStep::field("array"));
	REQUIRE(steps[2] == PathStep::index_of(1));
	REQUIRE(steps[3] == PathStep::field("property"));

	auto nested = PathParser::parse(".matrix[2][10]");
	REQUIRE(nested == vector<PathStep>{PathStep::field("matrix"), PathStep::index_of(2), PathStep::index_of(10)});
}

TEST_CASE("Flatten markers produce no step", "[parser][flatten]")
{
	REQUIRE(PathParser::parse(".root.array[].property") == PathParser::parse(".root.array.property"));
	REQUIRE(PathParser::parse(".a[][0]") == vector<PathStep>{PathStep::field("a"), PathStep::index_of(0)});
	REQUIRE(PathParser::strip_flatten(".a[].b[][3]") == ".a.b[3]");
}

TEST_CASE("Leading index addresses a root array", "[parser][index]")
{
	REQUIRE(PathParser::parse(".[0]") == vector<PathStep>{PathStep::index_of(0)});
	REQUIRE(PathParser::parse(".[1].name") == vector<PathStep>{PathStep::index_of(1), PathStep::field("name")});
}

TEST_CASE("Field names keep any character except separators", "[parser][field]")
{
	auto steps = PathParser::parse(".my-key.with space.$x.0");
	REQUIRE(steps.size() == 4);
	REQUIRE(steps[1].name == "with space");
	// digits after a dot are a field name, not an index
	REQUIRE(steps[3] == PathStep::field("0"));
}

TEST_CASE("Syntax errors are reported by kind", "[parser][error]")
{
	REQUIRE(parse_error_kind("") == ParseError::Kind::MissingLeadingDot);
	REQUIRE(parse_error_kind("root.leaf") == ParseError::Kind::MissingLeadingDot);
	REQUIRE(parse_error_kind("..a") == ParseError::Kind::EmptySegment);
	REQUIRE(parse_error_kind(".a.") == ParseError::Kind::EmptySegment);
	REQUIRE(parse_error_kind(".a.[0]") == ParseError::Kind::EmptySegment);
	REQUIRE(parse_error_kind(".a[x]") == ParseError::Kind::InvalidIndex);
	REQUIRE(parse_error_kind(".a[-1]") == ParseError::Kind::InvalidIndex);
	REQUIRE(parse_error_kind(".a[99999999999999999999999]") == ParseError::Kind::InvalidIndex);
	REQUIRE(parse_error_kind(".a[0") == ParseError::Kind::UnterminatedBracket);
	REQUIRE(parse_error_kind(".a[0.b") == ParseError::Kind::UnterminatedBracket);
	REQUIRE(parse_error_kind(".a[0]b") == ParseError::Kind::UnexpectedCharacter);
}

TEST_CASE("Parse errors carry the offending path", "[parser][error]")
{
	try
	{
		PathParser::parse("no.dot");
		FAIL("parse should have thrown");
	}
	catch (const ParseError &e)
	{
		REQUIRE(e.path() == "no.dot");
		REQUIRE(string(e.what()).find("no.dot") != string::npos);
	}
}

TEST_CASE("Canonical rendering of steps", "[parser][to_string]")
{
	REQUIRE(PathParser::to_string({}) == ".");
	REQUIRE(PathParser::to_string(PathParser::parse(".root.array[].property")) == ".root.array.property");
	REQUIRE(PathParser::to_string(PathParser::parse(".root.array[0].arrayLeaf")) == ".root.array[0].arrayLeaf");
	REQUIRE(PathParser::to_string(PathParser::parse(".[3].x")) == ".[3].x");

	auto steps = PathParser::parse(".a.b[2].c");
	REQUIRE(PathParser::to_string(steps, 0) == ".");
	REQUIRE(PathParser::to_string(steps, 3) == ".a.b[2]");
}

TEST_CASE("Closing bracket outside an index belongs to the field name", "[parser][field]")
{
	REQUIRE(PathParser::parse(".a]b") == vector<PathStep>{PathStep::field("a]b")});
	REQUIRE(PathParser::parse(".a].c[1]") ==
	        vector<PathStep>{PathStep::field("a]"), PathStep::field("c"), PathStep::index_of(1)});
}

TEST_CASE("Flatten marker on the root array", "[parser][flatten][root]")
{
	REQUIRE(PathParser::parse(".[].name") == vector<PathStep>{PathStep::field("name")});
	REQUIRE(PathParser::parse(".[][0]") == vector<PathStep>{PathStep::index_of(0)});
	// a literal double dot is still an empty segment
	REQUIRE(parse_error_kind("..name") == ParseError::Kind::EmptySegment);
}
