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
	@brief Tests for the JDS6600 register protocol
 */

#include <catch2/catch.hpp>

#include "ScriptedTransport.h"
#include "../bodehal/JDS6600FunctionGenerator.h"

using namespace std;

/**
	@brief Register file of a JDS6600 answering :w and :r commands
 */
class JDS6600Simulator
{
public:
	JDS6600Simulator()
		: m_acceptWrites(true)
	{
		m_registers[JDS6600FunctionGenerator::REG_DEVICETYPE] = "60";
		m_registers[JDS6600FunctionGenerator::REG_SERIALNUMBER] = "1234567";
		m_registers[JDS6600FunctionGenerator::REG_CHANNELENABLE] = "0,0";
		m_registers[JDS6600FunctionGenerator::REG_MODE] = "0";
	}

	string OnCommand(const string& cmd)
	{
		int reg;
		char value[64];
		if(2 == sscanf(cmd.c_str(), ":w%d=%63[^.].", &reg, value))
		{
			if(!m_acceptWrites)
				return ":err";
			m_registers[reg] = value;
			return ":ok";
		}
		if(1 == sscanf(cmd.c_str(), ":r%d=", &reg))
		{
			char reply[96];
			snprintf(reply, sizeof(reply), ":r%02d=%s.", reg, m_registers[reg].c_str());
			return reply;
		}
		return "";
	}

	map<int, string> m_registers;
	bool m_acceptWrites;
};

static ScriptedTransport* CreateTransport(JDS6600Simulator& sim)
{
	auto transport = new ScriptedTransport;
	transport->m_responder = [&sim](const string& cmd) { return sim.OnCommand(cmd); };
	return transport;
}

TEST_CASE("JDS6600_WireFormat")
{
	REQUIRE(JDS6600FunctionGenerator::FormatWrite(23, "123456,0") == ":w23=123456,0.");
	REQUIRE(JDS6600FunctionGenerator::FormatWrite(1, "5") == ":w01=5.");
	REQUIRE(JDS6600FunctionGenerator::FormatRead(33) == ":r33=0.");
	REQUIRE(JDS6600FunctionGenerator::FormatRead(0) == ":r00=0.");

	SECTION("Read replies")
	{
		auto v = JDS6600FunctionGenerator::ParseReadReply(24, ":r24=100000,3.");
		REQUIRE(v.has_value());
		REQUIRE(v->size() == 2);
		REQUIRE((*v)[0] == 100000);
		REQUIRE((*v)[1] == 3);

		auto s = JDS6600FunctionGenerator::ParseReadReply(1, ":r01=1234567.\r\n");
		REQUIRE(s.has_value());
		REQUIRE((*s)[0] == 1234567);
	}

	SECTION("Malformed replies")
	{
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, ":r23=1.").has_value());
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, ":r24=1..").has_value());
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, ":r24=1").has_value());
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, ":r24=.").has_value());
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, ":r24=1x,2.").has_value());
		REQUIRE_FALSE(JDS6600FunctionGenerator::ParseReadReply(24, "").has_value());
	}
}

TEST_CASE("JDS6600_Identify")
{
	JDS6600Simulator sim;
	sim.m_registers[JDS6600FunctionGenerator::REG_DEVICETYPE] = "30";
	auto transport = CreateTransport(sim);
	JDS6600FunctionGenerator gen(transport);

	REQUIRE(gen.GetName() == "JDS6600-30M");
	REQUIRE(gen.GetSerial() == "1234567");
	REQUIRE(gen.GetChannelCount() == 2);
	REQUIRE(gen.GetFunctionChannelMaxFrequency(0) == 30e6f);
	REQUIRE(gen.GetDriverName() == "jds6600");

	//Already in waveform mode, no mode change
	REQUIRE_FALSE(transport->WasSent(":w33=0."));
}

TEST_CASE("JDS6600_LeavesSweepMode")
{
	JDS6600Simulator sim;
	sim.m_registers[JDS6600FunctionGenerator::REG_MODE] = to_string(10 << 3);
	auto transport = CreateTransport(sim);
	JDS6600FunctionGenerator gen(transport);

	REQUIRE(transport->WasSent(":w32=0,0,0,0."));
	REQUIRE(transport->WasSent(":w33=0."));
	REQUIRE(gen.GetMode() == JDS6600FunctionGenerator::MODE_WAVE_CH1);
}

TEST_CASE("JDS6600_Settings")
{
	JDS6600Simulator sim;
	auto transport = CreateTransport(sim);
	JDS6600FunctionGenerator gen(transport);

	SECTION("Frequency")
	{
		REQUIRE(gen.SetFunctionChannelFrequency(0, 1234.56f));
		REQUIRE(transport->WasSent(":w23=123456,0."));
		REQUIRE(gen.GetFunctionChannelFrequency(0) == Approx(1234.56));

		//Readback honors the mHz multiplier
		sim.m_registers[JDS6600FunctionGenerator::REG_FREQUENCY2] = "123456,3";
		REQUIRE(gen.GetFunctionChannelFrequency(1) == Approx(1.23456));

		REQUIRE_FALSE(gen.SetFunctionChannelFrequency(0, 70e6));
	}

	SECTION("Amplitude")
	{
		REQUIRE(gen.SetFunctionChannelAmplitude(0, 5));
		REQUIRE(transport->WasSent(":w25=5000."));
		REQUIRE(gen.GetFunctionChannelAmplitude(0) == Approx(5));

		size_t sent = transport->m_sent.size();
		REQUIRE_FALSE(gen.SetFunctionChannelAmplitude(0, 25));
		REQUIRE(transport->m_sent.size() == sent);
	}

	SECTION("Offset")
	{
		REQUIRE(gen.SetFunctionChannelOffset(1, -1.5));
		REQUIRE(transport->WasSent(":w28=850."));
		REQUIRE(gen.GetFunctionChannelOffset(1) == Approx(-1.5));
	}

	SECTION("Shape")
	{
		REQUIRE(gen.SetFunctionChannelShape(0, FunctionGenerator::SHAPE_SINE));
		REQUIRE(transport->WasSent(":w21=0."));
		REQUIRE(gen.GetFunctionChannelShape(0) == FunctionGenerator::SHAPE_SINE);

		sim.m_registers[JDS6600FunctionGenerator::REG_WAVEFORM2] = "103";
		REQUIRE(gen.GetFunctionChannelShape(1) == FunctionGenerator::SHAPE_ARB);

		REQUIRE_FALSE(gen.SetFunctionChannelShape(0, FunctionGenerator::SHAPE_SAWTOOTH_UP));
	}

	SECTION("Output enable")
	{
		REQUIRE(gen.SetFunctionChannelActive(1, true));
		REQUIRE(transport->WasSent(":w20=0,1."));
		REQUIRE(gen.GetFunctionChannelActive(1));
		REQUIRE_FALSE(gen.GetFunctionChannelActive(0));
	}

	SECTION("Bad channel")
	{
		REQUIRE_FALSE(gen.SetFunctionChannelFrequency(2, 1e3));
	}

	SECTION("Rejected write")
	{
		sim.m_acceptWrites = false;
		REQUIRE_FALSE(gen.SetFunctionChannelFrequency(0, 1e3));
	}
}

TEST_CASE("JDS6600_SourceController")
{
	JDS6600Simulator sim;
	auto transport = CreateTransport(sim);
	JDS6600FunctionGenerator gen(transport);
	SignalSourceController source(gen, 0);

	source.Initialize(5);
	REQUIRE(sim.m_registers[JDS6600FunctionGenerator::REG_WAVEFORM1] == "0");
	REQUIRE(sim.m_registers[JDS6600FunctionGenerator::REG_OFFSET1] == "1000");
	REQUIRE(sim.m_registers[JDS6600FunctionGenerator::REG_AMPLITUDE1] == "5000");
	REQUIRE(sim.m_registers[JDS6600FunctionGenerator::REG_CHANNELENABLE] == "1,0");

	//Same amplitude again is not rewritten
	size_t sent = transport->m_sent.size();
	source.SetFrequency(1e3, 5);
	REQUIRE(transport->m_sent.size() == sent + 1);
	REQUIRE(sim.m_registers[JDS6600FunctionGenerator::REG_FREQUENCY1] == "100000,0");

	REQUIRE(source.GetMaxFrequency() == 60e6f);

	sim.m_acceptWrites = false;
	REQUIRE_THROWS_AS(source.SetFrequency(2e3, 5), DeviceCommunicationError);
}
