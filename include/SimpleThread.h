/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Threads
 * Author:   Andreas Vogel
 *
 ***************************************************************************
 *   Copyright (C) 2024 by Andreas Vogel   *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 2 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301,  USA.             *
 ***************************************************************************
 *
 */

#ifndef SIMPLETHREAD_H
#define SIMPLETHREAD_H
#include <thread>
#include <mutex>
#include <memory>
#include <functional>

//simple automatic unlocking mutex
typedef std::unique_lock<std::mutex> Synchronized;

/**
 * simple thread class
 * runs a function, must be joined before destruction
 */
class Thread{
public:
    typedef std::function<void(void)> RunFunction;
    typedef std::shared_ptr<Thread> Ptr;
private:
    std::unique_ptr<std::thread> mthread;
    RunFunction runFunction;
public:
    Thread(RunFunction function):runFunction(function){
    }
    ~Thread(){
        join();
    }
    Thread(const Thread &)=delete;
    Thread & operator=(const Thread &)=delete;
    void start(){
        if (mthread) return;
        if (! runFunction) return;
        mthread=std::make_unique<std::thread>(runFunction);
    }
    void join(){
        if (! mthread) return;
        if (! mthread ->joinable()) return;
        mthread->join();
        mthread.reset();
    };
};


#endif /* SIMPLETHREAD_H */
