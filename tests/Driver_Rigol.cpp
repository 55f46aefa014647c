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
	@brief Tests for the Rigol DS1000Z driver
 */

#include <catch2/catch.hpp>

#include "ScriptedTransport.h"
#include "../bodehal/RigolOscilloscope.h"

using namespace std;

static ScriptedTransport* CreateTransport()
{
	auto transport = new ScriptedTransport;
	transport->m_replies["*IDN?"] = "RIGOL TECHNOLOGIES,DS1054Z,DS1ZA000000001,00.04.04.SP4";
	return transport;
}

TEST_CASE("Rigol_ParsePreamble")
{
	auto p = RigolOscilloscope::ParsePreamble(
		"0,2,1200,1,2.000000e-06,-1.200000e-03,0,4.000000e-02,-1.270000e+02,127");
	REQUIRE(p.has_value());
	REQUIRE(p->format == RigolOscilloscope::CaptureFormat::BYTE);
	REQUIRE(p->type == RigolOscilloscope::CaptureType::RAW);
	REQUIRE(p->npoints == 1200);
	REQUIRE(p->averages == 1);
	REQUIRE(p->sec_per_sample == Approx(2e-6));
	REQUIRE(p->xorigin == Approx(-1.2e-3));
	REQUIRE(p->yincrement == Approx(0.04));
	REQUIRE(p->yorigin == Approx(-127));
	REQUIRE(p->yreference == Approx(127));

	REQUIRE_FALSE(RigolOscilloscope::ParsePreamble("0,5,1200,1,2e-06,0,0,0.04,0,127").has_value());
	REQUIRE_FALSE(RigolOscilloscope::ParsePreamble("0,2,1200,1").has_value());
	REQUIRE_FALSE(RigolOscilloscope::ParsePreamble("").has_value());
}

TEST_CASE("Rigol_ParseModel")
{
	auto m = RigolOscilloscope::ParseModel("DS1054Z");
	REQUIRE(m.has_value());
	REQUIRE(m->prefix == "DS");
	REQUIRE(m->number == 1054);
	REQUIRE(m->suffix == "Z");

	m = RigolOscilloscope::ParseModel("MSO1104Z-S");
	REQUIRE(m.has_value());
	REQUIRE(m->prefix == "MSO");
	REQUIRE(m->number == 1104);
	REQUIRE(m->suffix == "Z-S");

	REQUIRE_FALSE(RigolOscilloscope::ParseModel("DS2072A").has_value());
	REQUIRE_FALSE(RigolOscilloscope::ParseModel("DS1054").has_value());
	REQUIRE_FALSE(RigolOscilloscope::ParseModel("SDS1104X-E").has_value());
}

TEST_CASE("Rigol_Setup")
{
	auto transport = CreateTransport();
	RigolOscilloscope scope(transport);

	REQUIRE(scope.GetName() == "DS1054Z");
	REQUIRE(scope.GetVendor() == "RIGOL TECHNOLOGIES");
	REQUIRE(scope.GetChannelCount() == 4);
	REQUIRE(scope.GetChannel(1)->GetHwname() == "CHAN2");
	REQUIRE(transport->WasSent(":WAV:FORM BYTE"));
	REQUIRE(transport->WasSent(":WAV:MODE RAW"));
	REQUIRE(transport->WasSent(":CHAN4:VERN ON"));

	SECTION("Vertical")
	{
		scope.SetChannelVoltageRange(1, 0.5);
		scope.SetChannelOffset(0, 0);
		transport->FlushCommandQueue();
		REQUIRE(transport->WasSent(":CHAN2:RANGE 5.000000e-01"));
		REQUIRE(transport->WasSent(":CHAN1:OFFS 0.000000e+00"));
	}

	SECTION("Timebase")
	{
		transport->m_replies[":TIM:MAIN:SCAL?"] = "1.000000e-03";
		REQUIRE(scope.GetTimebaseScale() == 1000000000000LL);

		scope.SetTimebaseScale(200 * FS_PER_NANOSECOND);
		transport->FlushCommandQueue();
		REQUIRE(transport->WasSent(":TIM:MAIN:SCAL 2.000000e-07"));
		REQUIRE(scope.GetTimebaseScale() == 200000000LL);

		auto scales = scope.GetTimebaseScales();
		REQUIRE_FALSE(scales.empty());
		REQUIRE(scales.front() == 5000000LL);
	}

	SECTION("Offline after unanswered queries")
	{
		REQUIRE_FALSE(scope.IsOffline());
		for(size_t i=0; i<3; i++)
			scope.GetChannelVoltageRange(i);
		REQUIRE(scope.IsOffline());
	}
}

TEST_CASE("Rigol_Acquire")
{
	auto transport = CreateTransport();
	transport->m_replies[":CHAN1:DISP?"] = "1";
	transport->m_replies[":CHAN2:DISP?"] = "1";
	transport->m_replies[":CHAN3:DISP?"] = "0";
	transport->m_replies[":CHAN4:DISP?"] = "0";
	transport->m_replies[":ACQ:MDEP?"] = "AUTO";
	transport->m_replies[":TRIG:STAT?"] = "STOP";
	transport->m_replies["WAV:PRE?"] = "0,2,4,1,1.000000e-06,-2.000000e-06,0,1.000000e-02,0,127";

	string block = "#9000000004";
	block += static_cast<char>(127);
	block += static_cast<char>(137);
	block += static_cast<char>(117);
	block += static_cast<char>(255);
	block += "\n";
	transport->m_rawReplies["WAV:DATA?"] = block;

	RigolOscilloscope scope(transport);

	scope.StartSingleTrigger();
	REQUIRE(scope.PollTrigger() == Oscilloscope::TRIGGER_MODE_TRIGGERED);
	REQUIRE(scope.AcquireData());

	auto wfm = scope.PopChannelWaveform(0);
	REQUIRE(wfm != nullptr);
	REQUIRE(wfm->size() == 4);
	REQUIRE(wfm->m_timescale == 1000000000LL);
	REQUIRE(wfm->m_triggerPhase == -2000000000LL);
	REQUIRE((*wfm)[0] == Approx(0).margin(1e-6));
	REQUIRE((*wfm)[1] == Approx(0.1));
	REQUIRE((*wfm)[2] == Approx(-0.1));
	REQUIRE((wfm->m_flags & WaveformBase::WAVEFORM_CLIPPING) != 0);

	REQUIRE(scope.PopChannelWaveform(1) != nullptr);
	REQUIRE(scope.PopChannelWaveform(2) == nullptr);

	//Taken once only
	REQUIRE(scope.PopChannelWaveform(0) == nullptr);
}
