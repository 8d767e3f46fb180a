#include <stdlib.h>		//for strtoul,exit
#include <unistd.h>		//for getopt
#include <iostream>
#include <string>

#include "../lib/xfer.h"
#include "../lib/sender.h"

using namespace std;

static bool midline = false;	// a progress line is waiting for its newline

static void printprogress(double percentage, const string &message)
{
	cout<<"\r"<<message<<flush;
	midline = true;
}

static void printstatus(const string &message)
{
	if(midline)
	{
		cout<<endl;
		midline = false;
	}
	cout<<message<<endl;
}

static void usage(const char *prog)
{
	cerr<<"usage: "<<prog<<" [-c chunksize] <hostaddr> <port> <filename>\n";
}

int main(int argc, char **argv)
{
	XferConfig config;
	int opt;
	while((opt = getopt(argc, argv, "c:h")) != -1)
	{
		switch(opt)
		{
			case 'c':
			{
				char *end;
				unsigned long chunksize = strtoul(optarg, &end, 10);
				if(*optarg == '\0' || *end != '\0' || chunksize == 0 || chunksize > 0xffffffffUL)
				{
					cerr<<"ERROR invalid chunk size: "<<optarg<<endl;
					exit(1);
				}
				config.chunksize = (uint32_t)chunksize;
				break;
			}
			case 'h':
				usage(argv[0]);
				exit(0);
			default:
				usage(argv[0]);
				exit(1);
		}
	}

	if(argc - optind != 3)
	{
		usage(argv[0]);
		exit(1);
	}

	char *hostname = argv[optind];
	char *end;
	unsigned long portno = strtoul(argv[optind + 1], &end, 10);
	if(*end != '\0' || portno == 0 || portno > 65535)
	{
		cerr<<"ERROR invalid port number: "<<argv[optind + 1]<<endl;
		exit(1);
	}

	XferCallbacks callbacks;
	callbacks.onprogress = printprogress;
	callbacks.onstatus = printstatus;

	FileSender sender(config, callbacks);
	bool ok = sender.sendfile(argv[optind + 2], hostname, (unsigned short)portno);
	return ok ? 0 : 1;
}
