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
	@brief Tests for picking an oscilloscope among discovered instruments
 */

#include <catch2/catch.hpp>

#include "../bodehal/bodehal.h"

using namespace std;

/**
	@brief Discovery that reports a fixed list of instruments
 */
class FixedDiscovery : public InstrumentDiscovery
{
public:
	virtual vector<DiscoveredInstrument> Discover(unsigned int timeoutMs) override
	{
		m_lastTimeout = timeoutMs;
		return m_instruments;
	}

	void Add(const string& address, const string& id)
	{
		DiscoveredInstrument inst;
		inst.m_address = address;
		inst.m_id = id;
		m_instruments.push_back(inst);
	}

	vector<DiscoveredInstrument> m_instruments;
	unsigned int m_lastTimeout = 0;
};

TEST_CASE("Discovery_FindOscilloscope")
{
	FixedDiscovery discovery;

	SECTION("Nothing found")
	{
		REQUIRE_FALSE(discovery.FindOscilloscope(250).has_value());
		REQUIRE(discovery.m_lastTimeout == 250);
	}

	SECTION("Rigol preferred")
	{
		discovery.Add("192.168.1.20", "KEYSIGHT TECHNOLOGIES,33500B,MY12345678,4.00");
		discovery.Add("192.168.1.21", "Rigol Technologies,DS1054Z,DS1ZA000000001,00.04.04");
		discovery.Add("192.168.1.22", "RIGOL TECHNOLOGIES,DS1104Z,DS1ZA000000002,00.04.04");

		auto addr = discovery.FindOscilloscope(1000);
		REQUIRE(addr.has_value());
		REQUIRE(*addr == "192.168.1.21");
	}

	SECTION("First instrument otherwise")
	{
		discovery.Add("10.0.0.5", "SIGLENT,SDS1202X-E,SDS1ECDX000000,1.3.27");
		discovery.Add("10.0.0.6", "KEYSIGHT TECHNOLOGIES,33500B,MY12345678,4.00");

		auto addr = discovery.FindOscilloscope(1000);
		REQUIRE(addr.has_value());
		REQUIRE(*addr == "10.0.0.5");
	}
}

TEST_CASE("Discovery_CreateDefault")
{
	auto discovery = InstrumentDiscovery::CreateDefault();

#ifdef HAS_LXI
	REQUIRE(discovery != nullptr);
#else
	REQUIRE(discovery == nullptr);
#endif
}
