#include "forget_fs.hpp"

ForgetFs::ForgetFs(bool forget_delivery_reliable)
	: table_(forget_delivery_reliable), handler_(table_)
{
}

fuse_session *ForgetFs::new_session(fuse_args *args)
{
	fuse_lowlevel_ops ffs_oper{};
	assign_operations(ffs_oper);
	return fuse_session_new(args, &ffs_oper, sizeof(ffs_oper), &handler_);
}

void ForgetFs::check()
{
	table_.check();
}
