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
	@brief Implementation of SCPITransport
 */

#include "bodehal.h"

using namespace std;

SCPITransport::CreateMapType SCPITransport::m_createprocs;

SCPITransport::SCPITransport()
	: m_missedReplies(0)
{
}

SCPITransport::~SCPITransport()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Factory

void SCPITransport::DoAddTransportClass(string name, CreateProcType proc)
{
	m_createprocs[name] = proc;
}

SCPITransport* SCPITransport::CreateTransport(const string& transport, const string& args)
{
	auto it = m_createprocs.find(transport);
	if(it == m_createprocs.end())
	{
		LogError("No transport named \"%s\"\n", transport.c_str());
		return nullptr;
	}
	return it->second(args);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Framing

/**
	@brief Writes one command followed by a newline
 */
bool SCPITransport::SendCommand(const string& cmd)
{
	LogTrace("[%s] -> %s\n", GetConnectionString().c_str(), cmd.c_str());
	string line = cmd + "\n";
	return WriteRawData(reinterpret_cast<const unsigned char*>(line.c_str()), line.length());
}

/**
	@brief Reads bytes up to the end of the line, or up to a ';' if endOnSemicolon is set

	Carriage returns are dropped. A read timeout ends the reply early, so the caller sees a short or empty string.
 */
string SCPITransport::ReadReply(bool endOnSemicolon)
{
	string ret;
	unsigned char c;
	while(ReadRawData(1, &c) == 1)
	{
		if( (c == '\n') || ( (c == ';') && endOnSemicolon ) )
			break;
		if(c != '\r')
			ret += static_cast<char>(c);
	}
	LogTrace("[%s] <- %s\n", GetConnectionString().c_str(), ret.c_str());
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command queue

/**
	@brief Appends a command to the transmit queue without sending it
 */
void SCPITransport::SendCommandQueued(const string& cmd)
{
	lock_guard<mutex> lock(m_queueMutex);
	m_txQueue.push_back(cmd);
}

/**
	@brief Sends everything queued so far, in order

	@return False if any command could not be written
 */
bool SCPITransport::FlushCommandQueue()
{
	list<string> pending;
	{
		lock_guard<mutex> lock(m_queueMutex);
		pending.swap(m_txQueue);
	}

	bool ok = true;
	lock_guard<recursive_mutex> lock(m_netMutex);
	for(auto& cmd : pending)
	{
		if(!SendCommand(cmd))
		{
			LogWarning("[%s] Could not send \"%s\"\n", GetConnectionString().c_str(), cmd.c_str());
			ok = false;
		}
	}
	return ok;
}

/**
	@brief Flushes the queue, then sends a query and waits for its reply
 */
string SCPITransport::SendCommandQueuedWithReply(const string& cmd, bool endOnSemicolon)
{
	lock_guard<recursive_mutex> lock(m_netMutex);
	FlushCommandQueue();
	return SendCommandImmediateWithReply(cmd, endOnSemicolon);
}

/**
	@brief Sends a query ahead of anything queued and waits for its reply

	An empty reply counts as a missed one. Drivers use GetMissedReplyCount() to decide when an instrument is gone.
 */
string SCPITransport::SendCommandImmediateWithReply(const string& cmd, bool endOnSemicolon)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	string reply;
	if(SendCommand(cmd))
		reply = ReadReply(endOnSemicolon);

	if(reply.empty())
	{
		m_missedReplies ++;
		LogWarning("[%s] No reply to %s (%u in a row)\n", GetConnectionString().c_str(), cmd.c_str(), m_missedReplies);
	}
	else
		m_missedReplies = 0;

	return reply;
}
