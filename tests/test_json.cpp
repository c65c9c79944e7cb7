#include "catch2/catch.hpp"
#include "mini/json.hpp"

TEST_CASE("mini::parse keeps object key order") {
    mini::Object obj;
    REQUIRE(mini::parse(R"({"zeta": 1, "alpha": "a", "mid": [true, null]})", obj));
    REQUIRE(obj.size() == 3);
    auto it = obj.begin();
    REQUIRE(it->first == "zeta");
    REQUIRE(it->second.type == mini::Value::Type::Number);
    REQUIRE(it->second.number == 1.0);
    ++it;
    REQUIRE(it->first == "alpha");
    REQUIRE(it->second.str == "a");
    ++it;
    REQUIRE(it->first == "mid");
    REQUIRE(it->second.array.size() == 2);
    REQUIRE(it->second.array[0].boolean);
    REQUIRE(it->second.array[1].type == mini::Value::Type::Null);
}

TEST_CASE("mini::parse decodes escapes and unicode") {
    mini::Object obj;
    REQUIRE(mini::parse(R"({"s": "a\"b\\c\nd\u00e9\ud83d\ude00"})", obj));
    auto it = obj.find("s");
    REQUIRE(it != obj.end());
    REQUIRE(it->second.str == "a\"b\\c\nd\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("mini::parse rejects truncated and trailing input") {
    mini::Object obj;
    REQUIRE_FALSE(mini::parse(R"({"a": "b")", obj));
    mini::Object obj2;
    REQUIRE_FALSE(mini::parse(R"({"a": 1} trailing)", obj2));
    mini::Array arr;
    REQUIRE_FALSE(mini::parse("[1, 2", arr));
    mini::Value v;
    REQUIRE_FALSE(mini::parse("", v));
}

TEST_CASE("mini::parse into Value accepts any top-level type") {
    mini::Value v;
    REQUIRE(mini::parse(" [ {\"url\": \"x\"} ] ", v));
    REQUIRE(v.type == mini::Value::Type::Array);
    REQUIRE(v.array[0].object.find("url")->second.str == "x");

    mini::Value s;
    REQUIRE(mini::parse("\"plain\"", s));
    REQUIRE(s.type == mini::Value::Type::String);
}

TEST_CASE("mini::dump writes parseable, ordered output") {
    mini::Object obj;
    obj["username"] = mini::Value::makeString("me\"you");
    obj["count"] = mini::Value::makeNumber(3);
    obj["ok"] = mini::Value::makeBool(true);
    const std::string text = mini::dump(obj);
    REQUIRE(text.find("\"count\": 3") != std::string::npos);
    REQUIRE(text.find("\"username\"") < text.find("\"count\""));

    mini::Object back;
    REQUIRE(mini::parse(text, back));
    REQUIRE(back.find("username")->second.str == "me\"you");
    REQUIRE(back.find("ok")->second.boolean);

    REQUIRE(mini::dump(mini::Object{}) == "{}");
    REQUIRE(mini::dump(obj, 0) == R"({"username":"me\"you","count":3,"ok":true})");
}

TEST_CASE("mini::Object operator[] replaces in place") {
    mini::Object obj;
    obj["a"] = mini::Value::makeNumber(1);
    obj["b"] = mini::Value::makeNumber(2);
    obj["a"] = mini::Value::makeNumber(5);
    REQUIRE(obj.size() == 2);
    REQUIRE(obj.begin()->first == "a");
    REQUIRE(obj.begin()->second.number == 5.0);
}
