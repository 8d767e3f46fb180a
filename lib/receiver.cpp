#include "receiver.h"

#include <errno.h>			//for errno,EINTR,EEXIST,EADDRINUSE
#include <fcntl.h>			//for open,file permissions,opening modes
#include <string.h>			//for memset
#include <unistd.h>			//for close,unlink
#include <netdb.h>			//for getaddrinfo,addrinfo,gai_strerror
#include <arpa/inet.h>		//for inet_ntop,ntohs
#include <sys/select.h>		//for select()
#include <sys/socket.h>		//for socket,bind,listen,accept,setsockopt
#include <sys/time.h>		//for struct timeval
#include <exception>

#include "frame.h"
#include "md5sum.h"

using namespace std;

FileReceiver::FileReceiver(const XferConfig &config, const XferCallbacks &callbacks)
	: config(config), callbacks(callbacks)
{
}

bool FileReceiver::listen(const string &host, unsigned short portno, const StopToken &stop)
{
	ScopedFd listenfd(openlistener(host, portno));
	if(listenfd.get() < 0)
		return false;
	return serve(listenfd.get(), stop);
}

int FileReceiver::openlistener(const string &host, unsigned short portno, unsigned short *boundport)
{
	char port[8];
	snprintf(port, sizeof(port), "%u", (unsigned)portno);

	struct addrinfo hints, *res;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_PASSIVE;

	int rc = getaddrinfo(host.empty() ? NULL : host.c_str(), port, &hints, &res);
	if(rc != 0)
	{
		callbacks.status("Error: Invalid address: " + host + " (" + gai_strerror(rc) + ")");
		return -1;
	}

	ScopedFd parentfd(socket(res->ai_family, res->ai_socktype, res->ai_protocol));
	if(parentfd.get() < 0)
	{
		callbacks.status("Error opening socket: " + errnostr(errno));
		freeaddrinfo(res);
		return -1;
	}

	int optval = 1;
	setsockopt(parentfd.get(), SOL_SOCKET, SO_REUSEADDR, (const void *)&optval, sizeof(optval));

	if(bind(parentfd.get(), res->ai_addr, res->ai_addrlen) < 0)
	{
		int err = errno;
		freeaddrinfo(res);
		if(err == EADDRINUSE)
			callbacks.status("Error: Port " + string(port) + " is already in use");
		else
			callbacks.status("Error binding to " + host + ":" + port + ": " + errnostr(err));
		return -1;
	}
	freeaddrinfo(res);

	if(::listen(parentfd.get(), LISTENBACKLOG) < 0)
	{
		callbacks.status("Error on listen: " + errnostr(errno));
		return -1;
	}

	struct sockaddr_in serveraddr;
	socklen_t serverlen = sizeof(serveraddr);
	if(getsockname(parentfd.get(), (struct sockaddr *)&serveraddr, &serverlen) < 0)
	{
		callbacks.status("Error reading bound address: " + errnostr(errno));
		return -1;
	}
	unsigned short actualport = ntohs(serveraddr.sin_port);
	if(boundport != NULL)
		*boundport = actualport;

	callbacks.status("Listening on " + (host.empty() ? string("0.0.0.0") : host) + ":" +
		to_string(actualport) + " for incoming file transfers...");
	return parentfd.release();
}

int FileReceiver::waitforconnection(int listenfd)
{
	fd_set readfds;
	FD_ZERO(&readfds);
	FD_SET(listenfd, &readfds);

	struct timeval timeout;
	timeout.tv_sec = config.pollinterval / 1000;
	timeout.tv_usec = (config.pollinterval % 1000) * 1000;

	int n = select(listenfd + 1, &readfds, NULL, NULL, &timeout);
	if(n < 0)
		return errno == EINTR ? 0 : -1;
	return n > 0 ? 1 : 0;
}

void FileReceiver::backoff()
{
	struct timeval timeout;
	timeout.tv_sec = config.pollinterval / 1000;
	timeout.tv_usec = (config.pollinterval % 1000) * 1000;
	select(0, NULL, NULL, NULL, &timeout);
}

bool FileReceiver::serve(int listenfd, const StopToken &stop)
{
	while(!stop.stopped())
	{
		int ready = waitforconnection(listenfd);
		if(ready < 0)
		{
			callbacks.status("Critical error in receiver: " + errnostr(errno));
			return false;
		}
		if(ready == 0)
			continue;

		struct sockaddr_in clientaddr;
		socklen_t clientlen = sizeof(clientaddr);
		int childfd = accept(listenfd, (struct sockaddr *)&clientaddr, &clientlen);
		if(childfd < 0)
		{
			if(errno == EBADF || errno == EINVAL || errno == ENOTSOCK)
			{
				callbacks.status("Critical error in receiver: " + errnostr(errno));
				return false;
			}
			// aborted handshakes and EINTR: try the next one right away
			if(errno == EINTR || errno == ECONNABORTED)
				continue;
			// fd exhaustion and the like leave the connection queued, so the
			// listener stays readable: back off instead of spinning
			callbacks.status("Error on accept: " + errnostr(errno));
			backoff();
			continue;
		}
		ScopedFd conn(childfd);

		try
		{
			char hostaddrp[INET_ADDRSTRLEN] = "?";
			inet_ntop(AF_INET, &clientaddr.sin_addr, hostaddrp, sizeof(hostaddrp));
			callbacks.status("Connected by " + string(hostaddrp) + ":" + to_string(ntohs(clientaddr.sin_port)));

			TransferSession session;
			receiveonce(conn.get(), session);
			conn.reset();
			callbacks.status("Waiting for next file transfer...");
		}
		catch(const exception &e)
		{
			callbacks.status(string("Error during file transfer: ") + e.what());
		}
	}
	callbacks.status("Stopping receiver...");
	return true;
}

int FileReceiver::readmetadata(int connfd, TransferInfo &info)
{
	string header;
	framestatus status = recvframe(connfd, header);
	if(status == FRAME_CLOSED || status == FRAME_IOERROR)
	{
		callbacks.status("Error: Connection closed before receiving header");
		return -1;
	}
	if(status != FRAME_HEADER || parsemetaheader(header, info) < 0)
	{
		callbacks.status("Invalid file header received.");
		return -1;
	}

	// never write outside savedir
	size_t pos = info.filename.find_last_of('/');
	if(pos != string::npos)
		info.filename = info.filename.substr(pos + 1);
	if(info.filename.empty() || info.filename == "." || info.filename == "..")
	{
		callbacks.status("Invalid file name in header: " + header);
		return -1;
	}
	return 0;
}

int FileReceiver::createdestination(const string &filename, string &path)
{
	string dir = config.savedir.empty() ? string(".") : config.savedir;
	if(dir[dir.size() - 1] != '/')
		dir += '/';

	string stem = filename, extension;
	size_t dot = filename.rfind('.');
	if(dot != string::npos && dot > 0 && dot + 1 < filename.size())
	{
		stem = filename.substr(0, dot);
		extension = filename.substr(dot);
	}

	// O_EXCL makes the existence check and the creation one step
	for(unsigned long counter = 0; ; counter++)
	{
		path = dir + (counter == 0 ? filename : stem + "_" + to_string(counter) + extension);
		int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
		if(fd >= 0)
			return fd;
		if(errno != EEXIST)
		{
			callbacks.status("Error creating file " + path + ": " + errnostr(errno));
			return -1;
		}
	}
}

int FileReceiver::receivechunks(int connfd, FILE *fout, TransferSession &session, string &filehash)
{
	char buf[BUFSIZE];
	Md5Sum filesum;

	while(true)
	{
		string header;
		framestatus status = recvframe(connfd, header);
		if(status == FRAME_END)
			break;
		if(status != FRAME_HEADER)
		{
			callbacks.status(string("Error: ") + framestatusstr(status) + " before end of file marker");
			return -1;
		}

		uint64_t chunklen;
		string expected;
		if(parsechunkheader(header, chunklen, expected) < 0)
		{
			callbacks.status("Error: Invalid chunk header received: " + header);
			return -1;
		}

		// verify while streaming, the chunk is never held in memory whole
		Md5Sum chunksum;
		uint64_t remaining = chunklen;
		while(remaining > 0)
		{
			size_t want = remaining < BUFSIZE ? (size_t)remaining : BUFSIZE;
			ssize_t n = recvall(connfd, buf, want);
			if(n < 0)
			{
				callbacks.status("Error reading from socket: " + errnostr(errno));
				return -1;
			}
			if((size_t)n < want)
			{
				callbacks.status("Error: Connection closed in the middle of chunk " + to_string(session.chunksreceived + 1));
				return -1;
			}
			chunksum.update(buf, n);
			filesum.update(buf, n);
			if(fwrite(buf, sizeof(char), n, fout) != (size_t)n)
			{
				callbacks.status("Error writing to " + session.savedpath + ": " + errnostr(errno));
				return -1;
			}
			remaining -= n;
		}

		if(chunksum.hexdigest() != expected)
		{
			session.corruptedchunks++;
			callbacks.status("Warning: Checksum mismatch on chunk " + to_string(session.chunksreceived + 1) +
				". Data may be corrupted.");
		}

		session.bytesreceived += chunklen;
		session.chunksreceived++;
		if(session.filesize > 0)
		{
			callbacks.progress((double)session.bytesreceived / session.filesize * 100.0,
				formatprogress(session.bytesreceived, session.filesize, session.chunksreceived, 0));
		}
	}

	if(session.filesize == 0)
		callbacks.progress(100.0, formatprogress(session.bytesreceived, 0, session.chunksreceived, 0));
	filehash = filesum.hexdigest();
	return 0;
}

void FileReceiver::reportsummary(const TransferSession &session, const string &filename, const string &filehash)
{
	if(session.corruptedchunks > 0)
		callbacks.status("File received with " + to_string(session.corruptedchunks) +
			" corrupted chunks. Data integrity might be compromised.");
	else
		callbacks.status("File received successfully with verified integrity.");

	if(session.bytesreceived != session.filesize)
		callbacks.status("Warning: expected " + to_string(session.filesize) + " bytes but received " +
			to_string(session.bytesreceived));

	callbacks.status("md5sum of " + filename + " : " + filehash);
	callbacks.status("Saved as: " + session.savedpath);
}

bool FileReceiver::receiveonce(int connfd, TransferSession &session)
{
	TransferInfo info;
	if(readmetadata(connfd, info) < 0)
		return false;

	session.filesize = info.filesize;
	callbacks.status("Receiving file: " + info.filename + " (" + to_string(info.filesize) + " bytes)");

	ScopedFd fd(createdestination(info.filename, session.savedpath));
	if(fd.get() < 0)
		return false;

	ScopedFile fout(fdopen(fd.get(), "wb"));
	if(fout.get() == NULL)
	{
		callbacks.status("Error opening " + session.savedpath + ": " + errnostr(errno));
		fd.reset();
		unlink(session.savedpath.c_str());
		return false;
	}
	fd.release();		// owned by fout now

	string filehash;
	int rc;
	try
	{
		rc = receivechunks(connfd, fout.get(), session, filehash);
	}
	catch(...)
	{
		// a throwing callback must not leave a partial file behind
		fout.reset();
		unlink(session.savedpath.c_str());
		throw;
	}
	if(rc == 0 && fclose(fout.release()) != 0)
	{
		callbacks.status("Error writing to " + session.savedpath + ": " + errnostr(errno));
		rc = -1;
	}
	if(rc < 0)
	{
		fout.reset();
		unlink(session.savedpath.c_str());
		callbacks.status("Removed incomplete file " + session.savedpath);
		return false;
	}

	reportsummary(session, info.filename, filehash);
	return true;
}
