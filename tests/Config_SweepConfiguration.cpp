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
	@brief Tests for loading and saving sweep settings
 */

#include <catch2/catch.hpp>

#include "../bodehal/bodehal.h"

using namespace std;

TEST_CASE("Config_Load")
{
	SweepConfiguration config;

	SECTION("Partial file")
	{
		REQUIRE(config.LoadFromString(
			"sweep:\n"
			"  min: 1k\n"
			"  max: 2.2M\n"
			"  points: 100\n"
			"capture:\n"
			"  cycles: 3\n"
			"instruments:\n"
			"  scope: 192.168.1.20\n"
			"measurement:\n"
			"  phase: true\n"));

		REQUIRE(config.m_minFrequency == Approx(1e3));
		REQUIRE(config.m_maxFrequency == Approx(2.2e6));
		REQUIRE(config.m_points == 100);
		REQUIRE(config.m_cyclesOnScreen == Approx(3));
		REQUIRE(config.m_scopeAddress == "192.168.1.20");
		REQUIRE(config.m_phase);

		//Untouched keys keep their defaults
		REQUIRE_FALSE(config.m_linear);
		REQUIRE(config.m_retries == 2);
		REQUIRE(config.m_headroom == Approx(0.8));
		REQUIRE(config.m_generatorPort == "/dev/ttyUSB0");
		REQUIRE(config.m_plotPath == "bode.png");
	}

	SECTION("Plain numbers")
	{
		REQUIRE(config.LoadFromString("sweep: {min: 20, max: 20000}\ndemo: {corner: 4.7k}\n"));
		REQUIRE(config.m_minFrequency == Approx(20));
		REQUIRE(config.m_maxFrequency == Approx(20e3));
		REQUIRE(config.m_demoCornerFrequency == Approx(4.7e3));
	}

	SECTION("Bad values")
	{
		REQUIRE_FALSE(config.LoadFromString("sweep:\n  points: lots\n"));
		REQUIRE_FALSE(config.LoadFromString("sweep:\n  min: fast\n"));
		REQUIRE_FALSE(config.LoadFromString("capture: [1, 2"));
	}

	SECTION("Missing file")
	{
		REQUIRE_FALSE(config.Load(string("/nonexistent/bode.yml")));
	}
}

TEST_CASE("Config_Serialize")
{
	SweepConfiguration config;
	config.m_minFrequency = 10;
	config.m_maxFrequency = 50e3;
	config.m_linear = true;
	config.m_outputChannel = 2;
	config.m_csvPath = "out.csv";
	config.m_smoothing = false;

	YAML::Emitter out;
	out << config.Serialize();

	SweepConfiguration loaded;
	REQUIRE(loaded.LoadFromString(out.c_str()));
	REQUIRE(loaded.m_minFrequency == Approx(10));
	REQUIRE(loaded.m_maxFrequency == Approx(50e3));
	REQUIRE(loaded.m_linear);
	REQUIRE(loaded.m_outputChannel == 2);
	REQUIRE(loaded.m_csvPath == "out.csv");
	REQUIRE_FALSE(loaded.m_smoothing);
	REQUIRE(loaded.m_amplitude == Approx(config.m_amplitude));
}
