#include "operations.hpp"
#include "fs_handler.hpp"

static_assert(kRootInodeId == FUSE_ROOT_ID);

// Entries and attributes are never cached so that every access goes through
// lookup and the kernel's forget traffic reflects real references.
static constexpr double kTimeout = 0.0;

static FsHandler &get_handler(fuse_req_t req) {
    return *static_cast<FsHandler *>(fuse_req_userdata(req));
}

static void fill_attr(InodeId ino, const InodeAttributes &attrs, struct stat *st) {
    *st = {};
    st->st_ino = ino;
    st->st_mode = attrs.mode;
    st->st_nlink = attrs.nlink;
    st->st_size = attrs.size;
}

static void fill_entry(const ChildEntry &child, fuse_entry_param *e) {
    *e = {};
    e->ino = child.child;
    e->attr_timeout = kTimeout;
    e->entry_timeout = kTimeout;
    fill_attr(child.child, child.attributes, &e->attr);
}

static void ffs_init(void *userdata, fuse_conn_info *conn) {
    auto &handler = *static_cast<FsHandler *>(userdata);
    conn->no_interrupt = 1;
    handler.init();
}

static void ffs_lookup(fuse_req_t req, fuse_ino_t parent, const char *name) {
    ChildEntry child;
    int err = get_handler(req).lookup(parent, name, child);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    fuse_entry_param e;
    fill_entry(child, &e);
    fuse_reply_entry(req, &e);
}

static void ffs_getattr(fuse_req_t req, fuse_ino_t ino, fuse_file_info *fi) {
    (void)fi;
    InodeAttributes attrs;
    int err = get_handler(req).getattr(ino, attrs);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    struct stat attr;
    fill_attr(ino, attrs, &attr);
    fuse_reply_attr(req, &attr, kTimeout);
}

static void ffs_forget(fuse_req_t req, fuse_ino_t ino, uint64_t nlookup) {
    get_handler(req).forget(ino, nlookup);
    fuse_reply_none(req);
}

static void ffs_forget_multi(fuse_req_t req, size_t count, fuse_forget_data *forgets) {
    std::vector<ForgetRequest> batch;
    batch.reserve(count);
    for (size_t i = 0; i < count; i++)
        batch.push_back({forgets[i].ino, forgets[i].nlookup});

    get_handler(req).forget_multi(batch);
    fuse_reply_none(req);
}

static void ffs_mkdir(fuse_req_t req, fuse_ino_t parent, const char *name, mode_t mode) {
    (void)name;
    (void)mode;
    ChildEntry child;
    int err = get_handler(req).mkdir(parent, child);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    fuse_entry_param e;
    fill_entry(child, &e);
    fuse_reply_entry(req, &e);
}

static void ffs_create(fuse_req_t req, fuse_ino_t parent, const char *name, mode_t mode,
                       fuse_file_info *fi) {
    (void)name;
    (void)mode;
    ChildEntry child;
    int err = get_handler(req).create(parent, child);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    fuse_entry_param e;
    fill_entry(child, &e);
    fi->fh = 0;
    fi->direct_io = 1;
    fuse_reply_create(req, &e, fi);
}

static void ffs_open(fuse_req_t req, fuse_ino_t ino, fuse_file_info *fi) {
    int err = get_handler(req).open(ino);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    fi->fh = 0;
    fi->direct_io = 1;
    fuse_reply_open(req, fi);
}

static void ffs_opendir(fuse_req_t req, fuse_ino_t ino, fuse_file_info *fi) {
    int err = get_handler(req).opendir(ino);
    if (err) {
        fuse_reply_err(req, err);
        return;
    }

    fi->fh = 0;
    fuse_reply_open(req, fi);
}

void assign_operations(fuse_lowlevel_ops &ffs_oper) {
    ffs_oper.init = ffs_init;
    ffs_oper.lookup = ffs_lookup;
    ffs_oper.getattr = ffs_getattr;
    ffs_oper.forget = ffs_forget;
    ffs_oper.forget_multi = ffs_forget_multi;
    ffs_oper.mkdir = ffs_mkdir;
    ffs_oper.create = ffs_create;
    ffs_oper.open = ffs_open;
    ffs_oper.opendir = ffs_opendir;
}
