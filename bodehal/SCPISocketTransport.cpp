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
	@brief Implementation of SCPISocketTransport
 */

#include "bodehal.h"

#include <errno.h>

using namespace std;

//Bounds every query and every waveform block read
static const unsigned int SOCKET_TIMEOUT_US = 5 * 1000 * 1000;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPISocketTransport::SCPISocketTransport(const string& args)
	: m_socket(AF_INET, SOCK_STREAM, IPPROTO_TCP)
	, m_port(DEFAULT_PORT)
{
	auto colon = args.rfind(':');
	m_hostname = args.substr(0, colon);
	if(colon != string::npos)
	{
		unsigned int port = 0;
		if( (1 != sscanf(args.c_str() + colon + 1, "%u", &port)) || (port == 0) || (port > 65535) )
		{
			LogError("Bad port in \"%s\"\n", args.c_str());
			return;
		}
		m_port = port;
	}

	LogDebug("Connecting to %s:%u\n", m_hostname.c_str(), m_port);
	if(!m_socket.Connect(m_hostname, m_port))
	{
		m_socket.Close();
		LogError("Couldn't connect to %s:%u\n", m_hostname.c_str(), m_port);
		return;
	}

	if(!m_socket.SetRxTimeout(SOCKET_TIMEOUT_US) || !m_socket.SetTxTimeout(SOCKET_TIMEOUT_US))
	{
		LogError("Couldn't set timeouts on %s: %s\n", m_hostname.c_str(), strerror(errno));
		m_socket.Close();
		return;
	}

	if(!m_socket.DisableNagle())
		LogWarning("Couldn't disable Nagle on %s\n", m_hostname.c_str());
}

SCPISocketTransport::~SCPISocketTransport()
{
}

string SCPISocketTransport::GetTransportName()
{
	return "lan";
}

string SCPISocketTransport::GetConnectionString()
{
	return m_hostname + ":" + to_string(m_port);
}

bool SCPISocketTransport::IsConnected()
{
	return m_socket.IsValid();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Byte I/O

bool SCPISocketTransport::WriteRawData(const unsigned char* buf, size_t len)
{
	return m_socket.SendLooped(buf, len);
}

/**
	@brief Reads exactly len bytes

	@return len, or zero on timeout
 */
size_t SCPISocketTransport::ReadRawData(size_t len, unsigned char* buf)
{
	if(!m_socket.RecvLooped(buf, len))
	{
		LogTrace("[%s] Timed out waiting for %zu bytes\n", m_hostname.c_str(), len);
		return 0;
	}
	return len;
}

void SCPISocketTransport::FlushRXBuffer()
{
	m_socket.FlushRxBuffer();
}
