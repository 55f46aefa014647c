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
	@brief Tests for SCPITransport line framing and the command queue
 */

#include <catch2/catch.hpp>

#include "ScriptedTransport.h"

using namespace std;

TEST_CASE("Transport_Framing")
{
	ScriptedTransport transport;

	SECTION("Newline")
	{
		transport.m_replies["*IDN?"] = "RIGOL TECHNOLOGIES,DS1054Z,DS1ZA000000001,00.04.04";
		REQUIRE(transport.SendCommandImmediateWithReply("*IDN?") ==
			"RIGOL TECHNOLOGIES,DS1054Z,DS1ZA000000001,00.04.04");

		//The trailing \r\n is consumed along with the line
		REQUIRE(transport.m_raw.empty());
	}

	SECTION("Semicolon")
	{
		transport.m_replies[":CHAN1:RANGE?;OFFS?"] = "8.000000e+00;0.000000e+00";

		REQUIRE(transport.SendCommandImmediateWithReply(":CHAN1:RANGE?;OFFS?") == "8.000000e+00");
		REQUIRE(transport.ReadReply() == "0.000000e+00");
	}

	SECTION("Semicolon kept")
	{
		transport.m_replies[":r20=?"] = ":r20=a;b.";
		REQUIRE(transport.SendCommandImmediateWithReply(":r20=?", false) == ":r20=a;b.");
	}

	SECTION("Timeout")
	{
		REQUIRE(transport.SendCommandImmediateWithReply(":TRIG:STAT?").empty());
		REQUIRE(transport.GetMissedReplyCount() == 1);
	}
}

TEST_CASE("Transport_MissedReplies")
{
	ScriptedTransport transport;
	transport.m_replies[":TRIG:STAT?"] = "STOP";

	transport.SendCommandImmediateWithReply(":CHAN1:SCAL?");
	transport.SendCommandImmediateWithReply(":CHAN1:SCAL?");
	REQUIRE(transport.GetMissedReplyCount() == 2);

	//Any reply resets the count
	REQUIRE(transport.SendCommandImmediateWithReply(":TRIG:STAT?") == "STOP");
	REQUIRE(transport.GetMissedReplyCount() == 0);

	//A write failure counts as a miss too
	transport.m_connected = false;
	REQUIRE(transport.SendCommandImmediateWithReply(":TRIG:STAT?").empty());
	REQUIRE(transport.GetMissedReplyCount() == 1);
}

TEST_CASE("Transport_CommandQueue")
{
	ScriptedTransport transport;
	transport.m_replies[":TRIG:STAT?"] = "WAIT";

	transport.SendCommandQueued(":SING");
	transport.SendCommandQueued("*WAI");
	REQUIRE(transport.m_sent.empty());

	SECTION("Flush")
	{
		REQUIRE(transport.FlushCommandQueue());
		REQUIRE(transport.m_sent == vector<string>({":SING", "*WAI"}));

		//Nothing left to send
		REQUIRE(transport.FlushCommandQueue());
		REQUIRE(transport.m_sent.size() == 2);
	}

	SECTION("Queued query")
	{
		REQUIRE(transport.SendCommandQueuedWithReply(":TRIG:STAT?") == "WAIT");
		REQUIRE(transport.m_sent == vector<string>({":SING", "*WAI", ":TRIG:STAT?"}));
	}

	SECTION("Immediate query")
	{
		REQUIRE(transport.SendCommandImmediateWithReply(":TRIG:STAT?") == "WAIT");
		REQUIRE(transport.m_sent == vector<string>({":TRIG:STAT?"}));
	}

	SECTION("Write failure")
	{
		transport.m_connected = false;
		REQUIRE_FALSE(transport.FlushCommandQueue());
		REQUIRE(transport.m_sent.size() == 2);
	}
}

TEST_CASE("Transport_Factory")
{
	REQUIRE(SCPITransport::CreateTransport("carrier_pigeon", "coop:1") == nullptr);
}
