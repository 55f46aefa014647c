/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Tests for command-line parsing
 */

#include <catch2/catch.hpp>

#include "../bode/CommandLine.h"
#include <unistd.h>

using namespace std;

/**
	@brief YAML file in /tmp, removed again at the end of a test
 */
class TempConfigFile
{
public:
	TempConfigFile(const string& text)
	{
		char tmpl[] = "/tmp/bodeconfig.XXXXXX";
		int fd = mkstemp(tmpl);
		if(fd < 0)
			return;
		m_path = tmpl;
		if(write(fd, text.c_str(), text.length()) != static_cast<ssize_t>(text.length()))
			m_path = "";
		close(fd);
	}

	~TempConfigFile()
	{
		if(!m_path.empty())
			unlink(m_path.c_str());
	}

	string m_path;
};

TEST_CASE("CLI_Parse")
{
	SweepConfiguration config;

	SECTION("Frequencies")
	{
		REQUIRE(CommandLine::Parse({"1k", "2.2M", "20"}, config) == CommandLine::PARSE_OK);
		REQUIRE(config.m_minFrequency == Approx(1e3));
		REQUIRE(config.m_maxFrequency == Approx(2.2e6));
		REQUIRE(config.m_points == 20);
	}

	SECTION("Flags and values")
	{
		REQUIRE(CommandLine::Parse(
			{"--phase", "--linear", "--no_plot", "--awg_voltage", "2.5", "--retries", "0",
			"--step_time", "100", "--ds_ip", "10.0.0.5", "100", "10k"},
			config) == CommandLine::PARSE_OK);
		REQUIRE(config.m_phase);
		REQUIRE(config.m_linear);
		REQUIRE(config.m_plotPath.empty());
		REQUIRE(config.m_amplitude == Approx(2.5));
		REQUIRE(config.m_retries == 0);
		REQUIRE(config.m_stepTimeMs == 100);
		REQUIRE(config.m_scopeAddress == "10.0.0.5");
		REQUIRE(config.m_points == 50);
	}

	SECTION("Help")
	{
		REQUIRE(CommandLine::Parse({"1k", "--help"}, config) == CommandLine::PARSE_HELP);
	}

	SECTION("Usage errors")
	{
		REQUIRE(CommandLine::Parse({"1k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"1k", "10k", "5", "6"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"1k", "fast"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"1k", "10k", "0"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"--frobnicate", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"1k", "10k", "--output"}, config) == CommandLine::PARSE_ERROR);
	}

	SECTION("Negative retry count")
	{
		REQUIRE(CommandLine::Parse({"--retries", "-1", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(config.m_retries == 2);
	}

	SECTION("Bad step time")
	{
		REQUIRE(CommandLine::Parse({"--step_time", "-5", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"--step_time", "10ms", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(config.m_stepTimeMs == 0);
	}

	SECTION("Bad amplitude")
	{
		REQUIRE(CommandLine::Parse({"--awg_voltage", "loud", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(CommandLine::Parse({"--awg_voltage", "-1", "1k", "10k"}, config) == CommandLine::PARSE_ERROR);
		REQUIRE(config.m_amplitude == Approx(5));
	}
}

TEST_CASE("CLI_Config")
{
	SweepConfiguration config;

	SECTION("Missing file")
	{
		REQUIRE(CommandLine::Parse({"--config", "/nonexistent/bode.yml", "1k", "10k"}, config) ==
			CommandLine::PARSE_ERROR);
	}

	TempConfigFile file(
		"sweep:\n"
		"  min: 20\n"
		"  max: 20k\n"
		"  points: 30\n"
		"  retries: 5\n"
		"instruments:\n"
		"  amplitude: 1\n");
	REQUIRE_FALSE(file.m_path.empty());

	SECTION("Command line overrides the file")
	{
		//Options before --config still win
		REQUIRE(CommandLine::Parse({"--retries", "1", "--config", file.m_path, "100", "1k"}, config) ==
			CommandLine::PARSE_OK);
		REQUIRE(config.m_retries == 1);
		REQUIRE(config.m_amplitude == Approx(1));
		REQUIRE(config.m_minFrequency == Approx(100));
		REQUIRE(config.m_maxFrequency == Approx(1e3));
		REQUIRE(config.m_points == 30);
	}

	SECTION("Frequencies from the file")
	{
		REQUIRE(CommandLine::Parse({"--config", file.m_path}, config) == CommandLine::PARSE_OK);
		REQUIRE(config.m_minFrequency == Approx(20));
		REQUIRE(config.m_maxFrequency == Approx(20e3));
		REQUIRE(config.m_retries == 5);
	}
}

TEST_CASE("CLI_Numbers")
{
	unsigned int u = 7;
	REQUIRE(CommandLine::ParseUnsigned("42", u));
	REQUIRE(u == 42);
	REQUIRE_FALSE(CommandLine::ParseUnsigned("-1", u));
	REQUIRE_FALSE(CommandLine::ParseUnsigned("+3", u));
	REQUIRE_FALSE(CommandLine::ParseUnsigned(" 3", u));
	REQUIRE_FALSE(CommandLine::ParseUnsigned("", u));
	REQUIRE_FALSE(CommandLine::ParseUnsigned("99999999999999999999", u));
	REQUIRE(u == 42);

	size_t n = 0;
	REQUIRE(CommandLine::ParseCount("1", n));
	REQUIRE(n == 1);
	REQUIRE_FALSE(CommandLine::ParseCount("0", n));

	double d = 0;
	REQUIRE(CommandLine::ParseDouble("3.3", d));
	REQUIRE(d == Approx(3.3));
	REQUIRE_FALSE(CommandLine::ParseDouble("3.3V", d));
	REQUIRE_FALSE(CommandLine::ParseDouble("inf", d));
}
