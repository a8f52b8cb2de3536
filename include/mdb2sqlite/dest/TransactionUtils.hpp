// <TransactionUtils> -*- C++ -*-

#pragma once

#include "mdb2sqlite/dest/DestinationStore.hpp"
#include "mdb2sqlite/log/MessageSource.hpp"
#include "mdb2sqlite/Errors.hpp"

namespace mdb2sqlite {

//! \brief RAII transaction on a DestinationStore. The constructor
//! issues BEGIN TRANSACTION. Unless commit() was called, the
//! destructor rolls the transaction back, so an exception thrown
//! while a table is being created or populated never leaves that
//! table half-written.
//!
//! \code
//!   {
//!       ScopedTransaction transaction(dest);
//!       dest.executeDDL(...);
//!       dest.executeDDL(...);
//!       transaction.commit();
//!   }
//! \endcode
class ScopedTransaction
{
public:
    explicit ScopedTransaction(DestinationStore & store) :
        store_(store)
    {
        store_.beginTransaction();
    }

    ScopedTransaction(const ScopedTransaction &) = delete;
    ScopedTransaction & operator=(const ScopedTransaction &) = delete;

    ~ScopedTransaction()
    {
        if (committed_) {
            return;
        }

        //We are most likely unwinding from another exception
        //here. A failed rollback is reported, not thrown.
        try {
            store_.rollbackTransaction();
        } catch (const ExportException & ex) {
            log::MessageSource::getGlobalWarn()
                << "Unable to roll back transaction: " << ex.what();
        }
    }

    //! Issue COMMIT TRANSACTION
    void commit()
    {
        store_.commitTransaction();
        committed_ = true;
    }

private:
    DestinationStore & store_;
    bool committed_ = false;
};

} // namespace mdb2sqlite
