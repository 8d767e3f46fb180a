#ifndef XFER_RECEIVER_H
#define XFER_RECEIVER_H

#include <stdint.h>
#include <string>

#include "xfer.h"

// State of one inbound transfer, lives as long as its connection.
struct TransferSession
{
	std::string savedpath;
	uint64_t filesize;			// as declared by the sender
	uint64_t bytesreceived;
	uint64_t chunksreceived;
	uint64_t corruptedchunks;

	TransferSession() : filesize(0), bytesreceived(0), chunksreceived(0), corruptedchunks(0) {}
};

/*
Accepts connections one at a time and writes each incoming file into
config.savedir. A failed transfer only ends its own connection, the
accept loop keeps running until the StopToken is tripped.
*/
class FileReceiver
{
	public:

	FileReceiver(const XferConfig &config, const XferCallbacks &callbacks);

	// openlistener() followed by serve(). False only if the bind phase fails.
	bool listen(const std::string &host, unsigned short portno, const StopToken &stop);

	// Bound and listening socket with SO_REUSEADDR, or -1. Port 0 picks an
	// ephemeral port, reported through boundport.
	int openlistener(const std::string &host, unsigned short portno, unsigned short *boundport = NULL);

	// Accept loop. The token is checked every config.pollinterval ms while
	// idle and between transfers, never in the middle of one. Does not
	// close listenfd.
	bool serve(int listenfd, const StopToken &stop);

	// Receive one file from a connected stream socket.
	bool receiveonce(int connfd, TransferSession &session);

	private:

	// 1 when a connection is pending, 0 on timeout or signal, -1 on error.
	int waitforconnection(int listenfd);
	// Sleep config.pollinterval ms.
	void backoff();
	int readmetadata(int connfd, TransferInfo &info);
	int createdestination(const std::string &filename, std::string &path);
	int receivechunks(int connfd, FILE *fout, TransferSession &session, std::string &filehash);
	void reportsummary(const TransferSession &session, const std::string &filename, const std::string &filehash);

	XferConfig config;
	XferCallbacks callbacks;
};

#endif
