#include <catch.hpp>
#include <test_options.hpp>
#include "Log.hpp"

using namespace Laminar;

SCENARIO( "_Log prefixes every message with its topic and level" ) {
    GIVEN("A log writing to a string stream with every level enabled") {
        std::stringstream log;
        std::unique_ptr<_Log> cut { _Log::make_log(log) };
        cut->set_level(log_t::DEBUG);
        cut->set_inclusive(true);
        WHEN("each level is called with topic \"Slicer\" and text \"Done\"") {
            cut->fatal_error("Slicer", "Done");
            cut->error("Slicer", "Done");
            cut->warn("Slicer", "Done");
            cut->info("Slicer", "Done");
            cut->debug("Slicer", "Done");
            THEN("the level names are padded to six characters") {
                REQUIRE(log.str() ==
                    "Slicer  FERR: Done\n"
                    "Slicer   ERR: Done\n"
                    "Slicer  WARN: Done\n"
                    "Slicer  INFO: Done\n"
                    "Slicer DEBUG: Done\n");
            }
        }
        WHEN("the stream form is used") {
            cut->warn("GCode") << "Bed temperature " << 120 << " clamped";
            THEN("the header is written once, with no end of line added") {
                REQUIRE(log.str() == "GCode  WARN: Bed temperature 120 clamped");
            }
        }
        WHEN("a multiline continuation is written") {
            cut->info("Loader") << "first" << std::endl;
            cut->info("Loader", true) << "second" << std::endl;
            THEN("the continuation carries no header") {
                REQUIRE(log.str() == "Loader  INFO: first\nsecond\n");
            }
        }
        WHEN("a wide string message is logged") {
            cut->info("Config", L"réglage");
            THEN("it is converted to UTF-8") {
                REQUIRE(log.str() == "Config  INFO: r\xc3\xa9glage\n");
            }
        }
        WHEN("raw is called") {
            cut->raw("plain");
            THEN("only the text is written") {
                REQUIRE(log.str() == "plain\n");
            }
        }
    }
}

SCENARIO( "_Log level filtering" ) {
    GIVEN("An inclusive log at WARN") {
        std::stringstream log;
        std::unique_ptr<_Log> cut { _Log::make_log(log) };
        cut->set_inclusive(true);
        cut->set_level(log_t::WARN);
        WHEN("messages of every level are written") {
            cut->fatal_error("Topic", "a");
            cut->error("Topic", "b");
            cut->warn("Topic", "c");
            cut->info("Topic", "d");
            cut->debug("Topic", "e");
            THEN("WARN and the levels above it are kept") {
                REQUIRE(log.str() == "Topic  FERR: a\nTopic   ERR: b\nTopic  WARN: c\n");
            }
        }
    }
    GIVEN("An exclusive log at INFO only") {
        std::stringstream log;
        std::unique_ptr<_Log> cut { _Log::make_log(log) };
        cut->set_inclusive(false);
        cut->clear_level(log_t::ALL);
        cut->set_level(log_t::INFO);
        WHEN("messages of every level are written") {
            cut->error("Topic", "b");
            cut->info("Topic", "d");
            cut->debug("Topic", "e");
            THEN("only INFO is kept") {
                REQUIRE(log.str() == "Topic  INFO: d\n");
            }
        }
        WHEN("ERR is added to the set") {
            cut->set_level(log_t::ERR);
            cut->error("Topic", "b");
            cut->warn("Topic", "c");
            cut->info("Topic", "d");
            THEN("ERR and INFO are kept") {
                REQUIRE(log.str() == "Topic   ERR: b\nTopic  INFO: d\n");
            }
        }
    }
    GIVEN("A log with every level cleared") {
        std::stringstream log;
        std::unique_ptr<_Log> cut { _Log::make_log(log) };
        cut->clear_level(log_t::ALL);
        WHEN("a fatal error is written") {
            cut->fatal_error("Topic") << "lost";
            THEN("nothing reaches the stream") {
                REQUIRE(log.str() == "");
            }
        }
    }
}

SCENARIO( "_Log topic filtering" ) {
    GIVEN("A DEBUG log restricted to the Support topic") {
        std::stringstream log;
        std::unique_ptr<_Log> cut { _Log::make_log(log) };
        cut->set_level(log_t::DEBUG);
        cut->add_topic("Support");
        WHEN("Support and Slicer messages are written") {
            cut->info("Support", "kept");
            cut->info("Slicer", "dropped");
            THEN("only Support is written") {
                REQUIRE(log.str() == "Support  INFO: kept\n");
            }
        }
        WHEN("the topic filter is cleared") {
            cut->clear_topic("");
            cut->info("Slicer", "kept");
            THEN("every topic passes again") {
                REQUIRE(log.str() == "Slicer  INFO: kept\n");
            }
        }
    }
}

SCENARIO( "Log level names" ) {
    log_t level { log_t::ALL };
    GIVEN("Known and unknown level names") {
        THEN("known names are parsed regardless of case") {
            REQUIRE(log_level_from_string("Debug", level));
            REQUIRE(level == log_t::DEBUG);
            REQUIRE(log_level_from_string("error", level));
            REQUIRE(level == log_t::ERR);
        }
        THEN("an unknown name is rejected") {
            REQUIRE_FALSE(log_level_from_string("loud", level));
        }
    }
}
