#include "doctest.h"
#include "../../../order_client/json_text.hpp"

TEST_CASE("JsonText - Indented layout keeps order and number spelling") {
    const std::string body = R"({"orderId":1,"symbol":"BTCUSDT","status":"NEW","avgPrice":0.1,"origQty":"0.001"})";

    CHECK(order_client::format_json_text(body, 2) ==
          "{\n"
          "  \"orderId\": 1,\n"
          "  \"symbol\": \"BTCUSDT\",\n"
          "  \"status\": \"NEW\",\n"
          "  \"avgPrice\": 0.1,\n"
          "  \"origQty\": \"0.001\"\n"
          "}");
}

TEST_CASE("JsonText - Nested containers") {
    const std::string body = R"({"fills":[{"price":"10.5","qty":"1"}],"extra":{},"tags":[]})";

    CHECK(order_client::format_json_text(body, 2) ==
          "{\n"
          "  \"fills\": [\n"
          "    {\n"
          "      \"price\": \"10.5\",\n"
          "      \"qty\": \"1\"\n"
          "    }\n"
          "  ],\n"
          "  \"extra\": {},\n"
          "  \"tags\": []\n"
          "}");
}

TEST_CASE("JsonText - Single line drops whitespace outside strings only") {
    const std::string body = "{ \"msg\" : \"a, b: {c} \\\" d\" ,\n  \"code\" : -1 }";

    CHECK(order_client::format_json_text(body, 0) == R"({"msg":"a, b: {c} \" d","code":-1})");
}
