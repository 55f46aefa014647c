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
	@brief Declaration of SCPITransport
 */

#ifndef SCPITransport_h
#define SCPITransport_h

/**
	@brief A newline-framed command channel to one instrument

	Derived classes only move bytes. Framing, command queueing and tracking of unanswered queries live here, so
	every driver sees the same behavior whether the instrument sits on a socket or a serial port.
 */
class SCPITransport
{
public:
	SCPITransport();
	virtual ~SCPITransport();

	virtual std::string GetConnectionString() =0;
	virtual std::string GetName() =0;
	virtual bool IsConnected() =0;

	/*
		Queued command API

		Commands pushed with SendCommandQueued() stay in the queue until FlushCommandQueue() is called, or until
		the next *WithReply call flushes them ahead of the query.
	 */
	void SendCommandQueued(const std::string& cmd);
	std::string SendCommandQueuedWithReply(const std::string& cmd, bool endOnSemicolon = true);
	std::string SendCommandImmediateWithReply(const std::string& cmd, bool endOnSemicolon = true);
	bool FlushCommandQueue();

	///@brief Number of queries in a row that got an empty reply
	unsigned int GetMissedReplyCount() const
	{ return m_missedReplies; }

	//Manual mutex locking for ReadRawData() etc
	std::recursive_mutex& GetMutex()
	{ return m_netMutex; }

	//Line level access
	virtual bool SendCommand(const std::string& cmd);
	virtual std::string ReadReply(bool endOnSemicolon = true);
	virtual void FlushRXBuffer() =0;

	//Byte level access
	virtual size_t ReadRawData(size_t len, unsigned char* buf) =0;

protected:
	virtual bool WriteRawData(const unsigned char* buf, size_t len) =0;

public:
	typedef SCPITransport* (*CreateProcType)(const std::string& args);
	static void DoAddTransportClass(std::string name, CreateProcType proc);

	static SCPITransport* CreateTransport(const std::string& transport, const std::string& args);

protected:

	//Class enumeration
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;

	//Queued commands waiting to be sent
	std::mutex m_queueMutex;
	std::recursive_mutex m_netMutex;
	std::list<std::string> m_txQueue;

	unsigned int m_missedReplies;
};

#define TRANSPORT_INITPROC(T) \
	static SCPITransport* CreateInstance(const std::string& args) \
	{ \
		return new T(args); \
	} \
	virtual std::string GetName() override \
	{ return GetTransportName(); }

#define AddTransportClass(T) SCPITransport::DoAddTransportClass(T::GetTransportName(), T::CreateInstance)

#endif
